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

#define LOG_TAG "IntentBridgeService"

#include "IntentBridgeService.h"

#include <binder/IPCThreadState.h>
#include <binder/IServiceManager.h>
#include <errno.h>
#include <stdio.h>
#include <utils/String8.h>

#include <map>

#include "bridge/Logger.h"

namespace bridge {

using android::String16;
using android::String8;
using android::os::PersistableBundle;

static std::string toUtf8(const String16& str) {
    return std::string(String8(str).c_str());
}

IntentBridgeService::IntentBridgeService(const std::shared_ptr<BridgeContext>& context)
      : mModule(context) {}

IntentBridgeService::~IntentBridgeService() {
    invalidate();
}

PromisePtr IntentBridgeService::makePromise(const char* method, int32_t seqNo,
                                            const sp<IIntentCallback>& callback) {
    auto onResolve = [method, seqNo, callback](const PromiseValue& value) {
        Status status;
        if (const auto b = std::get_if<bool>(&value)) {
            status = callback->onResolveBoolean(seqNo, *b);
        } else if (const auto s = std::get_if<std::string>(&value)) {
            status = callback->onResolve(seqNo, *s);
        } else {
            status = callback->onResolve(seqNo, std::nullopt);
        }
        if (!status.isOk()) {
            ALOGE("%s reply failure. seqNo:%d error:%s", method, seqNo,
                  status.toString8().c_str());
        }
    };
    auto onReject = [method, seqNo, callback](int32_t code, const std::string& message) {
        ALOGW("%s seqNo:%d rejected:%s", method, seqNo, message.c_str());
        Status status = callback->onReject(seqNo, code, message);
        if (!status.isOk()) {
            ALOGE("%s reply failure. seqNo:%d error:%s", method, seqNo,
                  status.toString8().c_str());
        }
    };
    return std::make_shared<Promise>(onResolve, onReject);
}

static Status nullCallback(const char* method) {
    ALOGE("%s without callback", method);
    return Status::fromExceptionCode(Status::EX_ILLEGAL_ARGUMENT, "callback must not be null");
}

Status IntentBridgeService::getInitialURL(int32_t seqNo, const sp<IIntentCallback>& callback) {
    if (callback == nullptr) {
        return nullCallback(__func__);
    }
    mModule.getInitialURL(makePromise(__func__, seqNo, callback));
    return Status::ok();
}

Status IntentBridgeService::openURL(const std::optional<std::string>& url, int32_t seqNo,
                                    const sp<IIntentCallback>& callback) {
    if (callback == nullptr) {
        return nullCallback(__func__);
    }
    mModule.openURL(url, makePromise(__func__, seqNo, callback));
    return Status::ok();
}

Status IntentBridgeService::canOpenURL(const std::optional<std::string>& url, int32_t seqNo,
                                       const sp<IIntentCallback>& callback) {
    if (callback == nullptr) {
        return nullCallback(__func__);
    }
    mModule.canOpenURL(url, makePromise(__func__, seqNo, callback));
    return Status::ok();
}

Status IntentBridgeService::openSettings(int32_t seqNo, const sp<IIntentCallback>& callback) {
    if (callback == nullptr) {
        return nullCallback(__func__);
    }
    mModule.openSettings(makePromise(__func__, seqNo, callback));
    return Status::ok();
}

Status IntentBridgeService::sendIntent(const std::string& action,
                                       const std::optional<PersistableBundle>& extras,
                                       int32_t seqNo, const sp<IIntentCallback>& callback) {
    if (callback == nullptr) {
        return nullCallback(__func__);
    }
    std::optional<IntentExtras> intentExtras;
    if (extras.has_value()) {
        intentExtras = toIntentExtras(*extras);
    }
    mModule.sendIntent(action, intentExtras, makePromise(__func__, seqNo, callback));
    return Status::ok();
}

IntentExtras IntentBridgeService::toIntentExtras(const PersistableBundle& bundle) {
    std::map<std::string, ExtraValue> values;
    for (const auto& key : bundle.getBooleanKeys()) {
        bool value = false;
        bundle.getBoolean(key, &value);
        values[toUtf8(key)] = ExtraValue::ofBoolean(value);
    }
    for (const auto& key : bundle.getIntKeys()) {
        int32_t value = 0;
        bundle.getInt(key, &value);
        values[toUtf8(key)] = ExtraValue::ofNumber(value);
    }
    for (const auto& key : bundle.getLongKeys()) {
        int64_t value = 0;
        bundle.getLong(key, &value);
        values[toUtf8(key)] = ExtraValue::ofNumber(static_cast<double>(value));
    }
    for (const auto& key : bundle.getDoubleKeys()) {
        double value = 0;
        bundle.getDouble(key, &value);
        values[toUtf8(key)] = ExtraValue::ofNumber(value);
    }
    for (const auto& key : bundle.getStringKeys()) {
        String16 value;
        bundle.getString(key, &value);
        values[toUtf8(key)] = ExtraValue::ofString(toUtf8(value));
    }
    for (const auto& key : bundle.getPersistableBundleKeys()) {
        values[toUtf8(key)] = ExtraValue::ofMap();
    }
    for (const auto& keys : {bundle.getBooleanVectorKeys(), bundle.getIntVectorKeys(),
                             bundle.getLongVectorKeys(), bundle.getDoubleVectorKeys(),
                             bundle.getStringVectorKeys()}) {
        for (const auto& key : keys) {
            values[toUtf8(key)] = ExtraValue::ofArray();
        }
    }

    IntentExtras extras;
    for (const auto& it : values) {
        extras.emplace_back(it.first, it.second);
    }
    return extras;
}

android::status_t IntentBridgeService::dump(int fd, const android::Vector<String16>& args) {
    dprintf(fd, "%s:\n", IntentModule::name());
    dprintf(fd, "  initial url: %s\n", mModule.getInitialUrlState().c_str());
    return android::OK;
}

android::status_t IntentBridgeService::publish(UvLoop* loop) {
    int binderFd;
    android::IPCThreadState::self()->setupPolling(&binderFd);
    if (binderFd < 0) {
        ALOGE("failed to open binder device:%d", errno);
        return android::NO_INIT;
    }
    mBinderPoll = std::make_unique<UvPoll>(loop->get(), binderFd);
    mBinderPoll->start(UV_READABLE, [](int fd, int status, int events, void* data) {
        android::IPCThreadState::self()->handlePolledCommands();
    });

    const android::status_t ret =
            android::defaultServiceManager()->addService(String16(name()), this);
    if (ret != android::OK) {
        ALOGE("addService %s failure:%d", name(), ret);
        return ret;
    }
    ALOGI("%s is published", name());
    return android::OK;
}

void IntentBridgeService::invalidate() {
    mModule.invalidate();
    if (mBinderPoll) {
        mBinderPoll->stop();
        mBinderPoll.reset();
    }
}

} // namespace bridge
