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

#include "bridge/Promise.h"

#include "bridge/Logger.h"

namespace bridge {

std::string toString(const PromiseValue& value) {
    if (const auto b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return "null";
}

Promise::Promise(const ResolveCallback& onResolve, const RejectCallback& onReject)
      : mSettled(false), mOnResolve(onResolve), mOnReject(onReject) {}

bool Promise::markSettled() {
    std::lock_guard<std::mutex> lock(mLock);
    if (mSettled) {
        return false;
    }
    mSettled = true;
    return true;
}

bool Promise::resolve(const PromiseValue& value) {
    if (!markSettled()) {
        ALOGW("Promise[%p] has been settled, drop value:%s", this, toString(value).c_str());
        return false;
    }
    if (mOnResolve) {
        mOnResolve(value);
    }
    return true;
}

bool Promise::reject(int32_t code, const std::string& message) {
    if (!markSettled()) {
        ALOGW("Promise[%p] has been settled, drop error(%d):%s", this, code, message.c_str());
        return false;
    }
    if (mOnReject) {
        mOnReject(code, message);
    }
    return true;
}

} // namespace bridge
