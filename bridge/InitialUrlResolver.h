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
#include <variant>
#include <vector>

#include "bridge/BridgeContext.h"
#include "bridge/Promise.h"

namespace bridge {

/**
 * InitialUrlResolver answers "which url started the application".
 * While the host has no foreground surface the callers are parked, and they are
 * answered in request order as soon as the host resumes.
 *
 *   Idle  --request without surface-->  Armed (one lifecycle listener registered)
 *   Armed --request without surface-->  Armed (parked, no new listener)
 *   Armed --onHostResume/invalidate-->  Idle
 *
 * Must be owned by a std::shared_ptr, the listener only keeps a weak reference.
 */
class InitialUrlResolver : public std::enable_shared_from_this<InitialUrlResolver> {
public:
    /**
     * Answer the promise from the current surface.
     * @return false if there is no surface, the promise is left untouched
     */
    using Lookup = std::function<bool(const PromisePtr& promise)>;

    InitialUrlResolver(const std::shared_ptr<BridgeContext>& context, const Lookup& lookup);
    ~InitialUrlResolver();

    void request(const PromisePtr& promise);
    /** drop the parked callers without an answer, no request is served afterwards */
    void invalidate();

    bool isArmed();
    bool isInvalidated();
    size_t getPendingCount();

private:
    class SurfaceListener;

    /** keeps the listener registered until it is destroyed */
    class Subscription {
    public:
        Subscription(const std::shared_ptr<BridgeContext>& context,
                     const std::shared_ptr<SurfaceListener>& listener);
        ~Subscription();

        const std::shared_ptr<SurfaceListener>& getListener() const {
            return mListener;
        }

    private:
        std::shared_ptr<BridgeContext> mContext;
        std::shared_ptr<SurfaceListener> mListener;
    };

    struct Idle {};
    struct Armed {
        std::unique_ptr<Subscription> subscription;
        std::vector<PromisePtr> pending;
    };

    void onSurfaceBecameAvailable(const SurfaceListener* source);
    std::shared_ptr<SurfaceListener> armLocked(std::vector<PromisePtr>&& pending);
    void registerListener(const std::shared_ptr<SurfaceListener>& listener);

private:
    std::shared_ptr<BridgeContext> mContext;
    Lookup mLookup;

    std::recursive_mutex mLock;
    std::variant<Idle, Armed> mState;
    bool mInvalidated;
};

} // namespace bridge
