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

#include <gtest/gtest.h>
#include <string.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "bridge/UvLoop.h"

using namespace bridge;

namespace test {

TEST(UvLoopTest, run) {
    UvLoop looper;
    UvLoop* handler = &looper;
    looper.postTask([handler]() {
        EXPECT_EQ(handler->isAlive(), true);
        handler->stop();
    });
    EXPECT_EQ(looper.run(), 0);
    EXPECT_EQ(looper.isAlive(), false);
}

TEST(UvLoopTest, timer) {
    UvLoop looper;

    auto startTime = std::chrono::steady_clock::now();
    UvTimer timer(looper.get(), [startTime](void*) {
        auto endTime = std::chrono::steady_clock::now();
        auto duration =
                std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();
        EXPECT_GE(duration, 99);
    });
    timer.start(100, 0);

    UvLoop* handler = &looper;
    looper.postDelayTask([handler](void*) { handler->stop(); }, 200);
    EXPECT_EQ(looper.run(), 0);
}

TEST(UvLoopTest, postDelayTaskPassesData) {
    UvLoop looper;
    UvLoop* handler = &looper;
    int value = 0;
    looper.postDelayTask(
            [handler](void* data) {
                *reinterpret_cast<int*>(data) = 42;
                handler->stop();
            },
            10, &value);
    looper.run();
    EXPECT_EQ(value, 42);
}

TEST(UvLoopTest, taskPostedFromTask) {
    UvLoop looper;
    UvLoop* handler = &looper;
    std::vector<int> order;
    looper.postTask([handler, &order]() {
        order.push_back(1);
        handler->postTask([handler, &order]() {
            order.push_back(3);
            handler->stop();
        });
        order.push_back(2);
    });
    looper.run();
    EXPECT_EQ(order, std::vector<int>({1, 2, 3}));
}

TEST(UvLoopTest, postFromOtherThread) {
    UvLoop looper;
    UvLoop* handler = &looper;
    std::thread::id loopThread;
    std::thread::id taskThread;

    std::thread poster([handler, &taskThread]() {
        handler->postTask([handler, &taskThread]() {
            taskThread = std::this_thread::get_id();
            handler->stop();
        });
    });
    loopThread = std::this_thread::get_id();
    looper.run();
    poster.join();
    EXPECT_EQ(taskThread, loopThread);
}

TEST(UvLoopTest, poll_pipe) {
    UvLoop looper;
    UvLoop* handler = &looper;

    int fd[2];
    ASSERT_NE(pipe(fd), -1);

    UvPoll pollfd(looper.get(), fd[0]);
    pollfd.start(
            UV_READABLE,
            [handler](int f, int status, int events, void* data) {
                char buf[128];
                const ssize_t count = read(f, buf, sizeof(buf) - 1);
                ASSERT_GT(count, 0);
                buf[count] = 0;
                EXPECT_STREQ(buf, "UvPoll Test");
                handler->stop();
            },
            nullptr);
    const char buffer[] = "UvPoll Test";
    ASSERT_EQ(write(fd[1], buffer, strlen(buffer)), (ssize_t)strlen(buffer));
    looper.run();
    pollfd.close();
    ::close(fd[0]);
    ::close(fd[1]);
}

} // namespace test

extern "C" int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
