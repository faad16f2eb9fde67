/**
 * @file tokenward.hpp
 * @brief Main header for tokenward
 *
 * Client-side OAuth 2.0 credential lifecycle: PKCE authorization flows,
 * pluggable session and token storage, and token refresh coordinated across
 * threads and processes.
 */

#ifndef TOKENWARD_HPP
#define TOKENWARD_HPP

#include "tokenward/types.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/encoding.hpp"
#include "tokenward/pkce.hpp"
#include "tokenward/storage.hpp"
#include "tokenward/memory_storage.hpp"
#include "tokenward/file_storage.hpp"
#include "tokenward/file_lock.hpp"
#include "tokenward/transport.hpp"
#include "tokenward/curl_transport.hpp"
#include "tokenward/callback_server.hpp"
#include "tokenward/oauth.hpp"
#include "tokenward/registration.hpp"
#include "tokenward/refresher.hpp"
#include "tokenward/logging.hpp"
#include "tokenward/config.hpp"

namespace tokenward {

/// Library version
constexpr const char* VERSION = "0.1.0";

} // namespace tokenward

#endif // TOKENWARD_HPP
