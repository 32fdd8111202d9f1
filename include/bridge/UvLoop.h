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

#include <uv.h>

#include <functional>
#include <memory>
#include <mutex>
#include <queue>

namespace bridge {

using UV_CALLBACK = std::function<void(void*)>;

inline void uvCloseHandle(uv_handle_t* handler) {
    if (!uv_is_closing(handler)) {
        uv_close(handler, NULL);
    }
}

template <typename T>
class UvMsgQueue {
public:
    UvMsgQueue() : mAttached(false) {}
    virtual ~UvMsgQueue() {}

    int attachLoop(uv_loop_t* loop) {
        mUvAsync.data = this;
        const int ret = uv_async_init(loop, &mUvAsync, [](uv_async_t* handle) {
            UvMsgQueue* my = reinterpret_cast<UvMsgQueue*>(handle->data);
            my->processMessage();
        });
        mAttached = (ret == 0);
        return ret;
    }

    int push(T& msg) {
        std::lock_guard<std::mutex> lock(mMutex);
        mQueue.push(msg);
        return uv_async_send(&mUvAsync);
    }

    template <class... Args>
    int emplace(Args&&... args) {
        std::lock_guard<std::mutex> lock(mMutex);
        mQueue.emplace(std::forward<Args>(args)...);
        return uv_async_send(&mUvAsync);
    }

    virtual void handleMessage(const T& msg) = 0;

    void close() {
        if (mAttached) {
            uvCloseHandle((uv_handle_t*)&mUvAsync);
        }
    }

private:
    /** messages posted while handling are processed by the next wakeup */
    void processMessage() {
        std::queue<T> pending;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            pending.swap(mQueue);
        }
        while (!pending.empty()) {
            handleMessage(pending.front());
            pending.pop();
        }
    }

private:
    std::mutex mMutex;
    std::queue<T> mQueue;
    uv_async_t mUvAsync;
    bool mAttached;
};

class UvLoop {
public:
    UvLoop();
    ~UvLoop();

    using TaskCB = std::function<void()>;
    struct MsgCB {
        TaskCB callback;
        MsgCB(const TaskCB& cb) : callback(cb) {}
    };
    class MessageHandler : public UvMsgQueue<MsgCB> {
        void handleMessage(const MsgCB& msg) override {
            msg.callback();
        }
    };
    /** thread safe, the task runs on the loop thread */
    int postTask(TaskCB&& cb) {
        return mMsgHandler.emplace(cb);
    }

    uv_loop_t* get() const;
    int postDelayTask(const UV_CALLBACK& callback, uint64_t timeout, void* data = nullptr);

    int run(uv_run_mode mode = UV_RUN_DEFAULT);
    bool isAlive();
    int close();
    void stop();

private:
    std::unique_ptr<uv_loop_t> mLooper;
    MessageHandler mMsgHandler;
};

class UvTimer {
public:
    UvTimer() {
        mHandler = new uv_timer_t;
    }
    UvTimer(uv_loop_t* loop, const UV_CALLBACK& cb) {
        mHandler = new uv_timer_t;
        init(loop, cb);
    }
    ~UvTimer() {
        close();
    }

    int init(uv_loop_t* loop, const UV_CALLBACK& cb) {
        mCallback = cb;
        mHandler->data = this;
        return uv_timer_init(loop, mHandler);
    }

    int start(int64_t timeout, int64_t repeat = 0, void* data = nullptr) {
        mData = data;
        return uv_timer_start(
                mHandler,
                [](uv_timer_t* handle) {
                    UvTimer* my = reinterpret_cast<UvTimer*>(handle->data);
                    my->mCallback(my->mData);
                },
                timeout, repeat);
    }

    int stop() {
        return mHandler ? uv_timer_stop(mHandler) : 0;
    }

    void close() {
        if (mHandler && !uv_is_closing((uv_handle_t*)mHandler)) {
            uv_close((uv_handle_t*)mHandler,
                     [](uv_handle_t* handler) { delete reinterpret_cast<uv_timer_t*>(handler); });
            mHandler = nullptr;
        }
    }

private:
    uv_timer_t* mHandler;
    UV_CALLBACK mCallback;
    void* mData;
};

class UvPoll {
public:
    UvPoll() {
        mHandler = new uv_poll_t;
    }
    UvPoll(uv_loop_t* loop, int fd) {
        mHandler = new uv_poll_t;
        init(loop, fd);
    }
    ~UvPoll() {
        close();
    }

    int init(uv_loop_t* loop, int fd) {
        mFd = fd;
        mHandler->data = this;
        return uv_poll_init(loop, mHandler, fd);
    }

    using PollCallBack = std::function<void(int fd, int status, int events, void* data)>;
    int start(int event, const PollCallBack& cb, void* data = nullptr) {
        mCallback = cb;
        mData = data;
        return uv_poll_start(mHandler, event, [](uv_poll_t* handle, int status, int events) {
            UvPoll* my = reinterpret_cast<UvPoll*>(handle->data);
            my->mCallback(my->mFd, status, events, my->mData);
        });
    }

    int stop() {
        return mHandler ? uv_poll_stop(mHandler) : 0;
    }

    void close() {
        if (mHandler && !uv_is_closing((uv_handle_t*)mHandler)) {
            uv_close((uv_handle_t*)mHandler,
                     [](uv_handle_t* handler) { delete reinterpret_cast<uv_poll_t*>(handler); });
            mHandler = nullptr;
        }
    }

private:
    uv_poll_t* mHandler;
    int mFd;
    PollCallBack mCallback;
    void* mData;
};

} // namespace bridge
