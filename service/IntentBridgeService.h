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

#include <memory>
#include <optional>
#include <string>

#include "bridge/BnIntentBridge.h"
#include "bridge/IIntentCallback.h"
#include "bridge/IntentExtra.h"
#include "bridge/IntentModule.h"
#include "bridge/UvLoop.h"

namespace bridge {

using android::sp;
using android::binder::Status;

/**
 * IIntentBridge.aidl interface service, every call is answered through its callback.
 */
class IntentBridgeService : public BnIntentBridge {
public:
    explicit IntentBridgeService(const std::shared_ptr<BridgeContext>& context);
    ~IntentBridgeService();

    static inline const char* name() {
        return IIntentBridge::SERVICE_NAME().c_str();
    }

    /***binder api***/
    Status getInitialURL(int32_t seqNo, const sp<IIntentCallback>& callback) override;
    Status openURL(const std::optional<std::string>& url, int32_t seqNo,
                   const sp<IIntentCallback>& callback) override;
    Status canOpenURL(const std::optional<std::string>& url, int32_t seqNo,
                      const sp<IIntentCallback>& callback) override;
    Status openSettings(int32_t seqNo, const sp<IIntentCallback>& callback) override;
    Status sendIntent(const std::string& action,
                      const std::optional<android::os::PersistableBundle>& extras, int32_t seqNo,
                      const sp<IIntentCallback>& callback) override;

    android::status_t dump(int fd, const android::Vector<android::String16>& args) override;

    /** add to the servicemanager and handle the binder commands on the loop */
    android::status_t publish(UvLoop* loop);
    void invalidate();

    /** int, long and double are numbers, vectors are arrays, nested bundles are maps */
    static IntentExtras toIntentExtras(const android::os::PersistableBundle& bundle);

private:
    PromisePtr makePromise(const char* method, int32_t seqNo, const sp<IIntentCallback>& callback);

private:
    IntentModule mModule;
    std::unique_ptr<UvPoll> mBinderPoll;
};

} // namespace bridge
