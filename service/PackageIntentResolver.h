/*
 * Copyright (C) 2023 Xiaomi Corporation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>

#include "bridge/BridgeContext.h"

namespace bridge {

#define COMPONENT_NAME_SPLICE(p, c) (p + '/' + c)

/**
 * Resolve intents against the activities declared by the installed packages.
 * An explicit target wins, otherwise the first activity declaring the action is chosen.
 */
class PackageIntentResolver : public IntentResolver {
public:
    PackageIntentResolver() = default;
    ~PackageIntentResolver() = default;

    bool resolveActivity(const Intent& intent, std::string* component) override;
};

} // namespace bridge
