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

#include "bridge/Intent.h"

#include <algorithm>
#include <sstream>

namespace bridge {

using namespace android;

/****************** action definition *****************/
const std::string Intent::ACTION_VIEW("action.intent.VIEW");
const std::string Intent::ACTION_NDEF_DISCOVERED("action.nfc.NDEF_DISCOVERED");
const std::string Intent::ACTION_APPLICATION_DETAILS_SETTINGS(
        "action.settings.APPLICATION_DETAILS_SETTINGS");
/******************************************************/

/***************** category definition ****************/
const std::string Intent::CATEGORY_DEFAULT("category.intent.DEFAULT");
/******************************************************/

#define RETURN_IF_PARCEL_ERROR(expr) \
    {                                \
        status_t _ret = (expr);      \
        if (_ret != android::OK) {   \
            return _ret;             \
        }                            \
    }

void Intent::setTarget(const std::string& target) {
    mTarget = target;
}

void Intent::setAction(const std::string& action) {
    mAction = action;
}

void Intent::setData(const std::string& data) {
    mData = data;
}

void Intent::setFlag(const uint32_t flag) {
    mFlag = flag;
}

void Intent::addFlags(const uint32_t flags) {
    mFlag |= flags;
}

bool Intent::hasFlag(const uint32_t flag) const {
    return (mFlag & flag) == flag;
}

void Intent::addCategory(const std::string& category) {
    if (!hasCategory(category)) {
        mCategories.push_back(category);
    }
}

bool Intent::hasCategory(const std::string& category) const {
    return std::find(mCategories.begin(), mCategories.end(), category) != mCategories.end();
}

std::string Intent::getPackageOf(const std::string& component) {
    const auto pos = component.find('/');
    if (pos == std::string::npos) {
        return "";
    }
    return component.substr(0, pos);
}

std::string Intent::getTargetPackage() const {
    return getPackageOf(mTarget);
}

std::string Intent::toString() const {
    std::ostringstream os;
    os << "Intent{";
    if (!mTarget.empty()) {
        os << " target=" << mTarget;
    }
    if (!mAction.empty()) {
        os << " action=" << mAction;
    }
    if (!mData.empty()) {
        os << " data=" << mData;
    }
    for (const auto& category : mCategories) {
        os << " category=" << category;
    }
    os << " flag=0x" << std::hex << mFlag << " }";
    return os.str();
}

status_t Intent::readFromParcel(const Parcel* parcel) {
    RETURN_IF_PARCEL_ERROR(parcel->readUtf8FromUtf16(&mTarget));
    RETURN_IF_PARCEL_ERROR(parcel->readUtf8FromUtf16(&mAction));
    RETURN_IF_PARCEL_ERROR(parcel->readUtf8FromUtf16(&mData));
    RETURN_IF_PARCEL_ERROR(parcel->readUint32(&mFlag));
    RETURN_IF_PARCEL_ERROR(parcel->readUtf8VectorFromUtf16Vector(&mCategories));
    RETURN_IF_PARCEL_ERROR(mExtra.readFromParcel(parcel));
    return android::OK;
}

status_t Intent::writeToParcel(Parcel* parcel) const {
    RETURN_IF_PARCEL_ERROR(parcel->writeUtf8AsUtf16(mTarget));
    RETURN_IF_PARCEL_ERROR(parcel->writeUtf8AsUtf16(mAction));
    RETURN_IF_PARCEL_ERROR(parcel->writeUtf8AsUtf16(mData));
    RETURN_IF_PARCEL_ERROR(parcel->writeUint32(mFlag));
    RETURN_IF_PARCEL_ERROR(parcel->writeUtf8VectorAsUtf16Vector(mCategories));
    RETURN_IF_PARCEL_ERROR(mExtra.writeToParcel(parcel));
    return android::OK;
}

} // namespace bridge
