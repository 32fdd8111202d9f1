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

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace bridge {

/** null, boolean or string: everything an intent operation can answer with */
using PromiseValue = std::variant<std::monostate, bool, std::string>;

std::string toString(const PromiseValue& value);

/**
 * The completion handle of one call. It is settled at most once, either by
 * resolve() or by reject(); later attempts are ignored and return false.
 * The callbacks run on the thread that settles the promise.
 */
class Promise {
public:
    using ResolveCallback = std::function<void(const PromiseValue& value)>;
    using RejectCallback = std::function<void(int32_t code, const std::string& message)>;

    Promise(const ResolveCallback& onResolve, const RejectCallback& onReject);
    ~Promise() = default;

    bool resolve(const PromiseValue& value);
    bool reject(int32_t code, const std::string& message);

private:
    bool markSettled();

private:
    std::mutex mLock;
    bool mSettled;
    ResolveCallback mOnResolve;
    RejectCallback mOnReject;
};

using PromisePtr = std::shared_ptr<Promise>;

} // namespace bridge
