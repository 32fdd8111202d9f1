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

#define LOG_TAG "IntentModule"

#include "bridge/IntentModule.h"

#include <binder/Status.h>
#include <utils/String16.h>

#include "InitialUrlResolver.h"
#include "bridge/Logger.h"
#include "bridge/Uri.h"

namespace bridge {

using android::OK;
using android::status_t;
using android::String16;
using android::binder::Status;

static std::string describeUrl(const std::optional<std::string>& url) {
    return url.has_value() ? *url : "null";
}

static std::string describeStatus(const status_t status) {
    return "start activity failure(" + android::statusToString(status) + ")";
}

IntentModule::IntentModule(const std::shared_ptr<BridgeContext>& context) : mContext(context) {
    mInitialUrlResolver = std::make_shared<InitialUrlResolver>(
            context, [this](const PromisePtr& promise) { return lookupInitialUrl(promise); });
}

IntentModule::~IntentModule() {
    invalidate();
}

void IntentModule::invalidate() {
    mInitialUrlResolver->invalidate();
}

std::string IntentModule::getInitialUrlState() {
    if (mInitialUrlResolver->isInvalidated()) {
        return "Invalidated";
    }
    if (mInitialUrlResolver->isArmed()) {
        return "Armed(" + std::to_string(mInitialUrlResolver->getPendingCount()) + ")";
    }
    return "Idle";
}

void IntentModule::getInitialURL(const PromisePtr& promise) {
    mInitialUrlResolver->request(promise);
}

bool IntentModule::lookupInitialUrl(const PromisePtr& promise) {
    auto activity = mContext->getCurrentActivity();
    if (!activity) {
        return false;
    }

    const Intent& intent = activity->getIntent();
    if (intent.mData.empty() ||
        (intent.mAction != Intent::ACTION_VIEW && intent.mAction != Intent::ACTION_NDEF_DISCOVERED)) {
        promise->resolve(std::monostate());
        return true;
    }

    Uri uri;
    if (Uri::parse(intent.mData, &uri) != OK) {
        ALOGW("malformed initial url:%s", intent.mData.c_str());
        promise->reject(Status::EX_ILLEGAL_ARGUMENT,
                        "Could not get the initial URL : malformed uri '" + intent.mData + "'");
        return true;
    }
    promise->resolve(uri.toString());
    return true;
}

void IntentModule::openURL(const std::optional<std::string>& url, const PromisePtr& promise) {
    if (!url.has_value() || url->empty()) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT, "Invalid URL: " + describeUrl(url));
        return;
    }

    // An unparsable url is handed over as written, the launch decides
    Uri uri;
    const std::string data =
            Uri::parse(*url, &uri) == OK ? uri.normalizeScheme().toString() : *url;
    Intent intent(Intent::ACTION_VIEW, data);
    const status_t ret = sendOSIntent(intent, false);
    if (ret != OK) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT,
                        "Could not open URL '" + *url + "': " + describeStatus(ret));
        return;
    }
    promise->resolve(true);
}

void IntentModule::canOpenURL(const std::optional<std::string>& url, const PromisePtr& promise) {
    if (!url.has_value() || url->empty()) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT, "Invalid URL: " + describeUrl(url));
        return;
    }

    Uri uri;
    if (Uri::parse(*url, &uri) != OK) {
        ALOGD("canOpenURL %s: malformed uri", url->c_str());
        promise->resolve(false);
        return;
    }

    Intent intent(Intent::ACTION_VIEW, uri.toString());
    // the module starts activities from the application, not from an activity
    intent.addFlags(Intent::FLAG_ACTIVITY_NEW_TASK);

    std::string component;
    auto resolver = mContext->getIntentResolver();
    const bool canOpen = resolver && resolver->resolveActivity(intent, &component);
    ALOGD("canOpenURL %s:%s", url->c_str(), canOpen ? component.c_str() : "none");
    promise->resolve(canOpen);
}

void IntentModule::openSettings(const PromisePtr& promise) {
    auto activity = mContext->getCurrentActivity();
    if (!activity) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT,
                        "Could not open the Settings: there is no current activity");
        return;
    }

    Intent intent;
    intent.setAction(Intent::ACTION_APPLICATION_DETAILS_SETTINGS);
    intent.addCategory(Intent::CATEGORY_DEFAULT);
    intent.setData("package:" + mContext->getPackageName());
    intent.addFlags(Intent::FLAG_ACTIVITY_NEW_TASK | Intent::FLAG_ACTIVITY_NO_HISTORY |
                    Intent::FLAG_ACTIVITY_EXCLUDE_FROM_RECENTS);

    const status_t ret = activity->startActivity(intent);
    if (ret != OK) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT,
                        "Could not open the Settings: " + describeStatus(ret));
        return;
    }
    promise->resolve(true);
}

void IntentModule::sendIntent(const std::string& action, const std::optional<IntentExtras>& extras,
                              const PromisePtr& promise) {
    if (action.empty()) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT, "Invalid Action: " + action + ".");
        return;
    }

    Intent intent;
    intent.setAction(action);

    std::string component;
    auto resolver = mContext->getIntentResolver();
    if (!resolver || !resolver->resolveActivity(intent, &component)) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT,
                        "Could not launch Intent with action " + action + ".");
        return;
    }

    if (extras.has_value()) {
        for (const auto& extra : *extras) {
            const String16 key(extra.key.c_str());
            switch (extra.value.getType()) {
                case ExtraValue::TYPE_STRING:
                    intent.mExtra.putString(key, String16(extra.value.getString().c_str()));
                    break;
                case ExtraValue::TYPE_NUMBER:
                    // The runtime does not tell integers from doubles
                    intent.mExtra.putDouble(key, extra.value.getNumber());
                    break;
                case ExtraValue::TYPE_BOOLEAN:
                    intent.mExtra.putBoolean(key, extra.value.getBoolean());
                    break;
                default:
                    promise->reject(Status::EX_ILLEGAL_ARGUMENT,
                                    "Extra type for " + extra.key + " not supported.");
                    return;
            }
        }
    }

    const status_t ret = sendOSIntent(intent, true);
    if (ret != OK) {
        promise->reject(Status::EX_ILLEGAL_ARGUMENT,
                        "Could not launch Intent with action " + action + ": " +
                                describeStatus(ret));
        return;
    }
    promise->resolve(true);
}

status_t IntentModule::sendOSIntent(Intent& intent, bool useNewTaskFlag) {
    auto activity = mContext->getCurrentActivity();
    const std::string& selfPackageName = mContext->getPackageName();

    std::string component;
    auto resolver = mContext->getIntentResolver();
    if (!resolver) {
        component = intent.mTarget;
    } else if (!resolver->resolveActivity(intent, &component)) {
        component.clear();
    }
    const std::string otherPackageName = Intent::getPackageOf(component);

    // Without an activity, or towards another package, the intent needs its own task
    if (useNewTaskFlag || !activity || selfPackageName != otherPackageName) {
        intent.addFlags(Intent::FLAG_ACTIVITY_NEW_TASK);
    }

    ALOGI("send %s", intent.toString().c_str());
    if (activity) {
        return activity->startActivity(intent);
    }
    return mContext->startActivity(intent);
}

} // namespace bridge
