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

#define LOG_TAG "IntentBridge"

#include <signal.h>

#include <string_view>

#include "IntentBridgeService.h"
#include "IntentLauncher.h"
#include "PackageIntentResolver.h"
#include "bridge/HostContext.h"
#include "bridge/Logger.h"

namespace bridge {

/** The surface of the bridge process, it remembers the intent it was launched with */
class LaunchActivity : public Activity {
public:
    LaunchActivity(const Intent& intent, IntentLauncher* launcher)
          : mIntent(intent), mLauncher(launcher) {}

    const Intent& getIntent() override {
        return mIntent;
    }
    android::status_t startActivity(const Intent& intent) override {
        return mLauncher->startActivity(intent);
    }

private:
    const Intent mIntent;
    IntentLauncher* mLauncher;
};

static int showUsage() {
    printf("usage: intent_bridged <PACKAGE> [options]\n\n");
    printf("\t-a \t<ACTION> : the action the package was launched with\n");
    printf("\t-d \t<DATA>   : the data the package was launched with\n");
    printf("\n");
    return -1;
}

static int bridgeMain(int argc, char* argv[]) {
    if (argc < 2 || argv[1][0] == '-') {
        return showUsage();
    }
    const std::string packageName(argv[1]);
    Intent launchIntent;
    for (int i = 2; i < argc; ++i) {
        const std::string_view param(argv[i]);
        if (param == "-a" && i + 1 < argc) {
            launchIntent.setAction(argv[++i]);
        } else if (param == "-d" && i + 1 < argc) {
            launchIntent.setData(argv[++i]);
        } else {
            printf("unknow options:%s\n", argv[i]);
            return showUsage();
        }
    }

    UvLoop looper;
    IntentLauncher launcher;
    if (launcher.signalInit(looper.get()) != 0) {
        ALOGW("can't watch SIGCHLD, finished am commands are not reaped");
    }

    auto context = HostContext::create(
            packageName, &looper,
            [&launcher](const Intent& intent) { return launcher.startActivity(intent); },
            std::make_shared<PackageIntentResolver>());
    sp<IntentBridgeService> service = sp<IntentBridgeService>::make(context);
    if (service->publish(&looper) != android::OK) {
        return -1;
    }

    auto activity = std::make_shared<LaunchActivity>(launchIntent, &launcher);
    looper.postTask([context, activity]() { context->onHostResume(activity); });

    UvLoop* handler = &looper;
    uv_signal_t* stopSignal = new uv_signal_t;
    uv_signal_init(looper.get(), stopSignal);
    stopSignal->data = handler;
    uv_signal_start(
            stopSignal,
            [](uv_signal_t* handle, int signum) {
                ALOGI("receive signal:%d, stop", signum);
                reinterpret_cast<UvLoop*>(handle->data)->stop();
            },
            SIGTERM);

    ALOGI("%s serve package:%s", IntentModule::name(), packageName.c_str());
    looper.run();

    service->invalidate();
    uv_close((uv_handle_t*)stopSignal,
             [](uv_handle_t* handle) { delete reinterpret_cast<uv_signal_t*>(handle); });
    ALOGI("%s has been stop!!!", IntentModule::name());
    return 0;
}

} // namespace bridge

extern "C" int main(int argc, char* argv[]) {
    return bridge::bridgeMain(argc, argv);
}
