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
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

/**
 * @file mbox.hpp
 * @brief mbox - store-and-forward message broker
 *
 * Single-threaded poll reactor serving a fixed-header binary request/response
 * protocol. Each TCP connection carries one request and one response.
 * Clients and mailboxes live in SQLite.
 *
 * Usage:
 *   #include "mbox.hpp"
 *
 *   mbox::ServerConfig config;
 *   mbox::SqliteStore store(config.db_path);
 *   mbox::Dispatcher dispatcher(store);
 *   mbox::Server server(config, dispatcher);
 *   server.run();
 *
 * Dependencies: sockpp, SQLite3, C++17
 */

#ifndef MBOX_HPP_
#define MBOX_HPP_

#include "mbox/buffer.hpp"
#include "mbox/config.hpp"
#include "mbox/connection.hpp"
#include "mbox/console.hpp"
#include "mbox/dispatcher.hpp"
#include "mbox/log.hpp"
#include "mbox/protocol.hpp"
#include "mbox/response_builder.hpp"
#include "mbox/server.hpp"
#include "mbox/sqlite_store.hpp"
#include "mbox/store.hpp"
#include "mbox/vocabulary.hpp"

#endif  // MBOX_HPP_
