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

#define LOG_TAG "BridgeCommand"

#include "BridgeCommand.h"

#include <binder/IPCThreadState.h>
#include <binder/IServiceManager.h>
#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>

#include <string>

#include "bridge/BnIntentCallback.h"
#include "bridge/Logger.h"

#ifndef CONFIG_INTENT_BRIDGE_REPLY_TIMEOUT_MS
#define CONFIG_INTENT_BRIDGE_REPLY_TIMEOUT_MS 3000
#endif

namespace bridge {

using android::sp;
using android::String16;
using android::binder::Status;
using std::string;
using std::string_view;

/** Print the answer of the call and stop the loop */
class ReplyReceiver : public BnIntentCallback {
public:
    ReplyReceiver(UvLoop* looper) : mLooper(looper), mResult(-ETIMEDOUT) {}

    Status onResolve(int32_t seqNo, const std::optional<std::string>& value) override {
        printf("result: %s\n", value.has_value() ? value->c_str() : "null");
        finish(0);
        return Status::ok();
    }

    Status onResolveBoolean(int32_t seqNo, bool value) override {
        printf("result: %s\n", value ? "true" : "false");
        finish(0);
        return Status::ok();
    }

    Status onReject(int32_t seqNo, int32_t code, const std::string& message) override {
        printf("error(%d): %s\n", code, message.c_str());
        finish(code != 0 ? code : -1);
        return Status::ok();
    }

    int getResult() const {
        return mResult;
    }

private:
    void finish(int result) {
        mResult = result;
        mLooper->stop();
    }

    UvLoop* mLooper;
    int mResult;
};

BridgeCommand::BridgeCommand() : mNextArgs(0), mSeqNo(0) {
    mReceiver = sp<ReplyReceiver>::make(&mLooper);
}

BridgeCommand::~BridgeCommand() {}

string_view BridgeCommand::nextArg() {
    if (mNextArgs < mArgs.size()) {
        return mArgs[mNextArgs++];
    } else {
        return "";
    }
}

int BridgeCommand::putExtra(string_view option, string_view key, string_view value,
                            android::os::PersistableBundle& bundle) {
    const string text(value);
    if (key.empty()) {
        printf("option %s needs <EXTRA_KEY> <VALUE>\n", string(option).c_str());
        return -1;
    }
    const auto extraKey = String16(string(key).c_str());
    char* end = nullptr;
    errno = 0;
    if (option == "--ei") {
        const long number = strtol(text.c_str(), &end, 10);
        if (text.empty() || *end != '\0' || errno == ERANGE || number < INT32_MIN ||
            number > INT32_MAX) {
            printf("invalid int value for %s:%s\n", string(key).c_str(), text.c_str());
            return -1;
        }
        bundle.putInt(extraKey, static_cast<int32_t>(number));
    } else if (option == "--eu") {
        const double number = strtod(text.c_str(), &end);
        if (text.empty() || *end != '\0' || errno == ERANGE) {
            printf("invalid double value for %s:%s\n", string(key).c_str(), text.c_str());
            return -1;
        }
        bundle.putDouble(extraKey, number);
    } else if (option == "--ez") {
        if (value != "true" && value != "false") {
            printf("invalid boolean value for %s:%s\n", string(key).c_str(), text.c_str());
            return -1;
        }
        bundle.putBoolean(extraKey, value == "true");
    } else if (option == "-e" || option == "--es") {
        bundle.putString(extraKey, String16(text.c_str()));
    } else {
        printf("unknow options:%s\n", string(option).c_str());
        return -1;
    }
    return 0;
}

int BridgeCommand::makeExtras(android::os::PersistableBundle& bundle) {
    for (auto param = nextArg(); param != ""; param = nextArg()) {
        const auto key = nextArg();
        const auto value = nextArg();
        if (putExtra(param, key, value, bundle) != 0) {
            return -1;
        }
    }
    return 0;
}

sp<IIntentBridge> BridgeCommand::getService() {
    sp<IIntentBridge> service;
    if (android::getService<IIntentBridge>(String16(IIntentBridge::SERVICE_NAME().c_str()), &service) !=
                android::NO_ERROR ||
        service == nullptr) {
        printf("service is not existent, please check \"intent_bridged\" process\n");
        return nullptr;
    }
    return service;
}

int BridgeCommand::waitReply(const Status& status) {
    if (!status.isOk()) {
        printf("call error:%s\n", status.toString8().c_str());
        return -1;
    }

    int binderFd;
    android::IPCThreadState::self()->setupPolling(&binderFd);
    if (binderFd < 0) {
        printf("failed to open binder device:%d\n", errno);
        return -1;
    }
    UvPoll pollBinder(mLooper.get(), binderFd);
    pollBinder.start(UV_READABLE, [](int fd, int status, int events, void* data) {
        android::IPCThreadState::self()->handlePolledCommands();
    });

    UvLoop* handler = &mLooper;
    UvTimer timer(mLooper.get(), [handler](void*) {
        printf("no reply in %d ms\n", CONFIG_INTENT_BRIDGE_REPLY_TIMEOUT_MS);
        handler->stop();
    });
    timer.start(CONFIG_INTENT_BRIDGE_REPLY_TIMEOUT_MS, 0);

    mLooper.run();
    return mReceiver->getResult();
}

int BridgeCommand::getInitialURL() {
    auto service = getService();
    if (service == nullptr) {
        return -1;
    }
    return waitReply(service->getInitialURL(++mSeqNo, mReceiver));
}

int BridgeCommand::openURL() {
    auto service = getService();
    if (service == nullptr) {
        return -1;
    }
    const auto url = nextArg();
    return waitReply(service->openURL(string(url), ++mSeqNo, mReceiver));
}

int BridgeCommand::canOpenURL() {
    auto service = getService();
    if (service == nullptr) {
        return -1;
    }
    const auto url = nextArg();
    return waitReply(service->canOpenURL(string(url), ++mSeqNo, mReceiver));
}

int BridgeCommand::openSettings() {
    auto service = getService();
    if (service == nullptr) {
        return -1;
    }
    return waitReply(service->openSettings(++mSeqNo, mReceiver));
}

int BridgeCommand::sendIntent() {
    const auto action = string(nextArg());
    android::os::PersistableBundle bundle;
    if (makeExtras(bundle) != 0) {
        return -1;
    }
    auto service = getService();
    if (service == nullptr) {
        return -1;
    }
    std::optional<android::os::PersistableBundle> extras;
    if (!bundle.empty()) {
        extras = bundle;
    }
    return waitReply(service->sendIntent(action, extras, ++mSeqNo, mReceiver));
}

int BridgeCommand::dump() {
    const android::Vector<android::String16> args;
    if (auto service = getService()) {
        android::IInterface::asBinder(service)->dump(fileno(stdout), args);
        return 0;
    }
    return -1;
}

int BridgeCommand::run(int argc, char* argv[]) {
    if (argc < 2) {
        return showUsage();
    }

    for (int i = 1; i < argc; ++i) {
        mArgs.emplace_back(argv[i]);
    }

    const auto subCommand = nextArg();
    if ("geturl" == subCommand) {
        return getInitialURL();
    }
    if ("openurl" == subCommand) {
        return openURL();
    }
    if ("canopen" == subCommand) {
        return canOpenURL();
    }
    if ("settings" == subCommand) {
        return openSettings();
    }
    if ("send" == subCommand) {
        return sendIntent();
    }
    if ("dump" == subCommand) {
        return dump();
    }

    return showUsage();
}

int BridgeCommand::showUsage() {
    printf("usage: bridge [subcommand] [options]\n\n");
    printf(" geturl         \t the url the application was started with\n");
    printf(" openurl <URL>  \t open the url\n");
    printf(" canopen <URL>  \t check if an activity can open the url\n");
    printf(" settings       \t open the settings of the application\n");
    printf(" send <ACTION> [EXTRAS]\t start an activity by action\n");
    printf(" dump           \t show the bridge state\n");
    printf("\n You can make [EXTRAS] like:\n");
    printf("\t-e|--es \t<EXTRA_KEY> <EXTRA_STRING_VALUE>: eg. --es name XiaoMing\n");
    printf("\t--ei \t<EXTRA_KEY> <EXTRA_INT_VALUE>  : eg. --ei age 24\n");
    printf("\t--eu \t<EXTRA_KEY> <EXTRA_DOUBLE_VALUE>  : eg. --eu height 183.5\n");
    printf("\t--ez \t<EXTRA_KEY> <EXTRA_BOOLEAN_VALUE>  : eg. --ez student true\n");
    printf("\n");
    return 0;
}

} // namespace bridge
