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

#define LOG_TAG "InitialUrlResolver"

#include "InitialUrlResolver.h"

#include <binder/Status.h>

#include "bridge/Logger.h"

namespace bridge {

using android::binder::Status;

/** one-shot: only the first resume of its Armed phase is served */
class InitialUrlResolver::SurfaceListener : public LifecycleEventListener {
public:
    explicit SurfaceListener(const std::weak_ptr<InitialUrlResolver>& owner) : mOwner(owner) {}

    void onHostResume() override {
        if (auto owner = mOwner.lock()) {
            owner->onSurfaceBecameAvailable(this);
        }
    }
    void onHostPause() override {}
    void onHostDestroy() override {}

private:
    std::weak_ptr<InitialUrlResolver> mOwner;
};

InitialUrlResolver::Subscription::Subscription(const std::shared_ptr<BridgeContext>& context,
                                               const std::shared_ptr<SurfaceListener>& listener)
      : mContext(context), mListener(listener) {}

InitialUrlResolver::Subscription::~Subscription() {
    mContext->removeLifecycleEventListener(mListener);
}

InitialUrlResolver::InitialUrlResolver(const std::shared_ptr<BridgeContext>& context,
                                       const Lookup& lookup)
      : mContext(context), mLookup(lookup), mState(Idle{}), mInvalidated(false) {}

InitialUrlResolver::~InitialUrlResolver() {
    invalidate();
}

void InitialUrlResolver::request(const PromisePtr& promise) {
    std::shared_ptr<SurfaceListener> listener;
    {
        std::lock_guard<std::recursive_mutex> lock(mLock);
        if (mInvalidated) {
            promise->reject(Status::EX_ILLEGAL_STATE,
                            "Could not get the initial URL : module has been invalidated");
            return;
        }
        if (mLookup(promise)) {
            return;
        }
        if (auto armed = std::get_if<Armed>(&mState)) {
            armed->pending.push_back(promise);
            ALOGD("park initial url request, %zu pending", armed->pending.size());
            return;
        }
        listener = armLocked({promise});
    }
    registerListener(listener);
}

std::shared_ptr<InitialUrlResolver::SurfaceListener> InitialUrlResolver::armLocked(
        std::vector<PromisePtr>&& pending) {
    auto listener = std::make_shared<SurfaceListener>(weak_from_this());
    Armed armed;
    armed.subscription = std::make_unique<Subscription>(mContext, listener);
    armed.pending = std::move(pending);
    ALOGD("wait for the host surface, %zu pending", armed.pending.size());
    mState = std::move(armed);
    return listener;
}

void InitialUrlResolver::registerListener(const std::shared_ptr<SurfaceListener>& listener) {
    // The context may deliver onHostResume from inside the registration
    mContext->addLifecycleEventListener(listener);

    std::lock_guard<std::recursive_mutex> lock(mLock);
    auto armed = std::get_if<Armed>(&mState);
    if (armed == nullptr || armed->subscription->getListener() != listener) {
        // drained or invalidated before the registration completed
        mContext->removeLifecycleEventListener(listener);
    }
}

void InitialUrlResolver::onSurfaceBecameAvailable(const SurfaceListener* source) {
    std::shared_ptr<SurfaceListener> listener;
    {
        std::lock_guard<std::recursive_mutex> lock(mLock);
        auto armed = std::get_if<Armed>(&mState);
        if (armed == nullptr || armed->subscription->getListener().get() != source) {
            ALOGD("ignore the resume of a finished listener");
            return;
        }

        Armed drained = std::move(*armed);
        mState = Idle{};
        drained.subscription.reset();

        ALOGD("host surface is available, answer %zu pending", drained.pending.size());
        std::vector<PromisePtr> parkAgain;
        for (const auto& promise : drained.pending) {
            if (!mLookup(promise)) {
                parkAgain.push_back(promise);
            }
        }
        if (parkAgain.empty()) {
            return;
        }
        // The surface is gone again, the remaining callers wait for the next resume
        if (auto armedAgain = std::get_if<Armed>(&mState)) {
            armedAgain->pending.insert(armedAgain->pending.begin(), parkAgain.begin(),
                                       parkAgain.end());
            return;
        }
        listener = armLocked(std::move(parkAgain));
    }
    registerListener(listener);
}

void InitialUrlResolver::invalidate() {
    std::lock_guard<std::recursive_mutex> lock(mLock);
    mInvalidated = true;
    if (auto armed = std::get_if<Armed>(&mState)) {
        if (!armed->pending.empty()) {
            ALOGW("invalidate: drop %zu initial url requests", armed->pending.size());
        }
        armed->pending.clear();
    }
    mState = Idle{};
}

bool InitialUrlResolver::isArmed() {
    std::lock_guard<std::recursive_mutex> lock(mLock);
    return std::holds_alternative<Armed>(mState);
}

bool InitialUrlResolver::isInvalidated() {
    std::lock_guard<std::recursive_mutex> lock(mLock);
    return mInvalidated;
}

size_t InitialUrlResolver::getPendingCount() {
    std::lock_guard<std::recursive_mutex> lock(mLock);
    if (auto armed = std::get_if<Armed>(&mState)) {
        return armed->pending.size();
    }
    return 0;
}

} // namespace bridge
