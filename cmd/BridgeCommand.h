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

#include <binder/PersistableBundle.h>

#include <string_view>
#include <vector>

#include "bridge/IIntentBridge.h"
#include "bridge/UvLoop.h"

namespace bridge {

class ReplyReceiver;

class BridgeCommand {
public:
    BridgeCommand();
    ~BridgeCommand();

    int showUsage();
    int run(int argc, char* argv[]);

    /** put one "--es/--ei/--eu/--ez <KEY> <VALUE>" extra, -1 on a bad option or value */
    static int putExtra(std::string_view option, std::string_view key, std::string_view value,
                        android::os::PersistableBundle& bundle);

private:
    std::string_view nextArg();
    int makeExtras(android::os::PersistableBundle& bundle);
    android::sp<IIntentBridge> getService();
    int waitReply(const android::binder::Status& status);

    int getInitialURL();
    int openURL();
    int canOpenURL();
    int openSettings();
    int sendIntent();
    int dump();

private:
    UvLoop mLooper;
    android::sp<ReplyReceiver> mReceiver;
    std::vector<std::string_view> mArgs;
    size_t mNextArgs;
    int32_t mSeqNo;
};

} // namespace bridge
