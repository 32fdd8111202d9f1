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

#define LOG_TAG "IntentLauncher"

#include "IntentLauncher.h"

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <utils/String8.h>

#include <sstream>

#include "bridge/Logger.h"

extern char** environ;

namespace bridge {

using android::OK;
using android::status_t;
using android::String16;
using android::String8;

static std::string toUtf8(const String16& str) {
    return std::string(String8(str).c_str());
}

IntentLauncher::IntentLauncher(const std::string& amCommand)
      : mAmCommand(amCommand), mSignalHandler(nullptr) {}

IntentLauncher::~IntentLauncher() {
    if (mSignalHandler) {
        uv_signal_stop(mSignalHandler);
        uv_close((uv_handle_t*)mSignalHandler,
                 [](uv_handle_t* handle) { delete reinterpret_cast<uv_signal_t*>(handle); });
        mSignalHandler = nullptr;
    }
}

int IntentLauncher::signalInit(uv_loop_t* looper) {
    mSignalHandler = new uv_signal_t;
    uv_signal_init(looper, mSignalHandler);
    mSignalHandler->data = this;
    return uv_signal_start(
            mSignalHandler,
            [](uv_signal_t* handle, int signum) {
                pid_t pid;
                int status;
                while ((pid = waitpid(-1, &status, WNOHANG)) > 0) {
                    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
                        ALOGW("am process:%d exit:%d", pid, WEXITSTATUS(status));
                    } else if (WIFSIGNALED(status)) {
                        ALOGE("am process:%d exception exit by signal:%d", pid, WTERMSIG(status));
                    }
                }
            },
            SIGCHLD);
}

std::vector<std::string> IntentLauncher::makeStartArgs(const Intent& intent) {
    std::vector<std::string> args{"start"};
    if (!intent.mTarget.empty()) {
        args.insert(args.end(), {"-t", intent.mTarget});
    }
    if (!intent.mAction.empty()) {
        args.insert(args.end(), {"-a", intent.mAction});
    }
    if (!intent.mData.empty()) {
        args.insert(args.end(), {"-d", intent.mData});
    }
    if (intent.mFlag != Intent::NO_FLAG) {
        args.insert(args.end(), {"-f", std::to_string(intent.mFlag)});
    }
    // am has no option for categories, they are resolved on this side

    const auto& extra = intent.mExtra;
    for (const auto& key : extra.getStringKeys()) {
        String16 value;
        extra.getString(key, &value);
        args.insert(args.end(), {"--es", toUtf8(key), toUtf8(value)});
    }
    for (const auto& key : extra.getIntKeys()) {
        int32_t value = 0;
        extra.getInt(key, &value);
        args.insert(args.end(), {"--ei", toUtf8(key), std::to_string(value)});
    }
    for (const auto& key : extra.getDoubleKeys()) {
        double value = 0;
        extra.getDouble(key, &value);
        std::ostringstream os;
        os << value;
        args.insert(args.end(), {"--eu", toUtf8(key), os.str()});
    }
    for (const auto& key : extra.getBooleanKeys()) {
        bool value = false;
        extra.getBoolean(key, &value);
        args.insert(args.end(), {"--ez", toUtf8(key), value ? "true" : "false"});
    }
    return args;
}

status_t IntentLauncher::startActivity(const Intent& intent) {
    const auto args = makeStartArgs(intent);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(mAmCommand.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    const int ret = posix_spawnp(&pid, mAmCommand.c_str(), NULL, NULL, argv.data(), environ);
    if (ret != 0) {
        ALOGE("posix_spawn %s failed error:%d", mAmCommand.c_str(), ret);
        return -ret;
    }
    ALOGD("am process:%d start %s", pid, intent.toString().c_str());
    return OK;
}

} // namespace bridge
