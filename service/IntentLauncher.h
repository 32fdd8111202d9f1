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

#include <uv.h>

#include <string>
#include <vector>

#include "bridge/Intent.h"

namespace bridge {

/**
 * IntentLauncher hands intents over to the activity manager by spawning its
 * "am" command, and reaps the finished commands on the loop.
 */
class IntentLauncher {
public:
    explicit IntentLauncher(const std::string& amCommand = "am");
    ~IntentLauncher();

    int signalInit(uv_loop_t* looper);
    android::status_t startActivity(const Intent& intent);

    /** "start -t <TARGET> -a <ACTION> -d <DATA> -f <FLAG> --es <KEY> <VALUE> ..." */
    static std::vector<std::string> makeStartArgs(const Intent& intent);

private:
    const std::string mAmCommand;
    uv_signal_t* mSignalHandler;
};

} // namespace bridge
