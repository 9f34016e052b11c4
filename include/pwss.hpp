/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file pwss.hpp
 * @brief PWSS - Protocol WebSocket Server
 *
 * A blocking, typed-message WebSocket server. Applications declare an inbound
 * and an outbound Protocol; the server performs the HTTP upgrade, serves a
 * JSON manifest at /manifest and hands out ClientStreams that read and send
 * decoded Messages.
 *
 * Usage:
 *   #include "pwss.hpp"
 *
 *   int main() {
 *     auto in = pwss::Protocol::Builder("EchoIn").variant("Say", {pwss::FieldType::kString}).build();
 *     auto out = pwss::Protocol::Builder("EchoOut").variant("Said", {pwss::FieldType::kString}).build();
 *     pwss::Server server(8080, "echo", in, out);
 *     while (auto stream = server.accept()) {
 *       while (auto msg = stream->read()) {
 *         stream->send(out->make("Said", msg.value().get<std::string>(0)));
 *       }
 *     }
 *   }
 */

#ifndef PWSS_HPP_
#define PWSS_HPP_

#include "pwss/client_stream.hpp"
#include "pwss/codec.hpp"
#include "pwss/frame.hpp"
#include "pwss/handshake.hpp"
#include "pwss/log.hpp"
#include "pwss/protocol.hpp"
#include "pwss/server.hpp"
#include "pwss/utils.hpp"
#include "pwss/vocabulary.hpp"

#endif  // PWSS_HPP_
