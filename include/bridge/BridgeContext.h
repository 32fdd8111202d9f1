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

#include <memory>
#include <string>

#include "bridge/Intent.h"
#include "bridge/LifecycleEventListener.h"

namespace bridge {

/** The foreground surface of the host */
class Activity {
public:
    Activity() = default;
    virtual ~Activity() = default;

    /** The intent that started this activity */
    virtual const Intent& getIntent() = 0;
    virtual android::status_t startActivity(const Intent& intent) = 0;
};

class IntentResolver {
public:
    IntentResolver() = default;
    virtual ~IntentResolver() = default;

    /**
     * Find the activity which can handle the intent.
     * @param component: "package/Activity" of the best match
     * @return false if no activity matches
     */
    virtual bool resolveActivity(const Intent& intent, std::string* component) = 0;
};

/**
 * BridgeContext: everything the intent module needs from its host.
 */
class BridgeContext {
public:
    BridgeContext() = default;
    virtual ~BridgeContext() = default;

    virtual const std::string& getPackageName() const = 0;
    /** nullptr while the host has no foreground surface */
    virtual std::shared_ptr<Activity> getCurrentActivity() = 0;
    /** nullptr if the platform has no intent resolution */
    virtual std::shared_ptr<IntentResolver> getIntentResolver() = 0;
    /** start an activity without a foreground surface */
    virtual android::status_t startActivity(const Intent& intent) = 0;

    virtual void addLifecycleEventListener(
            const std::shared_ptr<LifecycleEventListener>& listener) = 0;
    virtual void removeLifecycleEventListener(
            const std::shared_ptr<LifecycleEventListener>& listener) = 0;
};

} // namespace bridge
