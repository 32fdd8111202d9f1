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

#include "BridgeCommand.h"

#include <stdio.h>

extern "C" int main(int argc, char* argv[]) {
    bridge::BridgeCommand cmd;
    const int ret = cmd.run(argc, argv);
    if (ret != 0) {
        printf("Command execution error:%d\n", ret);
    }
    return ret;
}
