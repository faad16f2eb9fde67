/**
 * @file c_api.cpp
 * @brief C interface to tokenward
 */

#include "tokenward/tokenward.h"
#include "tokenward/tokenward.hpp"
#include <cstring>
#include <new>

using namespace tokenward;

struct tokenward_storage {
    std::shared_ptr<Storage> storage;
};

struct tokenward_oauth {
    std::shared_ptr<OAuthClient> client;
};

struct tokenward_refresher {
    std::shared_ptr<TokenRefresher> refresher;
};

static thread_local std::string g_last_error;

static void set_error(const std::string& message) {
    g_last_error = message;
}

static void clear_error() {
    g_last_error.clear();
}

// Call from inside a catch block only
static tokenward_error translate_current_exception() {
    try {
        throw;
    } catch (const std::bad_alloc&) {
        set_error("Out of memory");
        return TOKENWARD_ERROR_OUT_OF_MEMORY;
    } catch (const InvalidConfigError& e) {
        set_error(e.what());
        return TOKENWARD_ERROR_INVALID_ARGUMENT;
    } catch (const ValidationError& e) {
        set_error(e.what());
        return TOKENWARD_ERROR_INVALID_ARGUMENT;
    } catch (const SessionNotFoundError& e) {
        set_error(e.what());
        return TOKENWARD_ERROR_NOT_FOUND;
    } catch (const TokenNotFoundError& e) {
        set_error(e.what());
        return TOKENWARD_ERROR_NOT_FOUND;
    } catch (const std::exception& e) {
        set_error(e.what());
        return TOKENWARD_ERROR_UNKNOWN;
    } catch (...) {
        set_error("Unknown error");
        return TOKENWARD_ERROR_UNKNOWN;
    }
}

static char* copy_string(const std::string& value) {
    char* copy = new char[value.size() + 1];
    std::memcpy(copy, value.c_str(), value.size() + 1);
    return copy;
}

static std::string optional_string(const char* value) {
    return value ? std::string(value) : std::string();
}

extern "C" {

const char* tokenward_version(void) {
    return tokenward::VERSION;
}

const char* tokenward_last_error_message(void) {
    return g_last_error.c_str();
}

// =============================================================================
// Storage
// =============================================================================

tokenward_storage* tokenward_storage_memory_create(void) {
    clear_error();
    try {
        return new tokenward_storage{std::make_shared<MemoryStorage>()};
    } catch (...) {
        translate_current_exception();
        return nullptr;
    }
}

tokenward_storage* tokenward_storage_file_create(const char* path) {
    clear_error();
    if (!path) {
        set_error("path is NULL");
        return nullptr;
    }
    try {
        return new tokenward_storage{std::make_shared<FileStorage>(path)};
    } catch (...) {
        translate_current_exception();
        return nullptr;
    }
}

void tokenward_storage_destroy(tokenward_storage* storage) {
    delete storage;
}

// =============================================================================
// OAuth client
// =============================================================================

tokenward_oauth* tokenward_oauth_create(const tokenward_oauth_config* config, tokenward_storage* storage) {
    clear_error();
    if (!config || !storage) {
        set_error("config and storage are required");
        return nullptr;
    }

    try {
        OAuthConfig oauth_config;
        oauth_config.client_id = optional_string(config->client_id);
        oauth_config.authorization_endpoint = optional_string(config->authorization_endpoint);
        oauth_config.token_endpoint = optional_string(config->token_endpoint);
        oauth_config.redirect_uri = optional_string(config->redirect_uri);
        if (config->scope) {
            oauth_config.scope = std::string(config->scope);
        }
        oauth_config.validate();

        auto client = std::make_shared<OAuthClient>(
            std::move(oauth_config), storage->storage, std::make_shared<CurlTransport>());
        return new tokenward_oauth{client};
    } catch (...) {
        translate_current_exception();
        return nullptr;
    }
}

void tokenward_oauth_destroy(tokenward_oauth* client) {
    delete client;
}

tokenward_error tokenward_oauth_start_flow(tokenward_oauth* client, tokenward_auth_flow* result) {
    clear_error();
    if (!client || !result) {
        set_error("client and result are required");
        return TOKENWARD_ERROR_INVALID_ARGUMENT;
    }

    result->url = nullptr;
    result->state = nullptr;
    try {
        AuthFlowResult flow = client->client->start_auth_flow();
        result->url = copy_string(flow.url);
        result->state = copy_string(flow.state);
        return TOKENWARD_OK;
    } catch (...) {
        tokenward_auth_flow_free(result);
        return translate_current_exception();
    }
}

void tokenward_auth_flow_free(tokenward_auth_flow* result) {
    if (!result) return;
    delete[] result->url;
    delete[] result->state;
    result->url = nullptr;
    result->state = nullptr;
}

// =============================================================================
// Refresher
// =============================================================================

tokenward_refresher* tokenward_refresher_create(tokenward_oauth* client) {
    clear_error();
    if (!client) {
        set_error("client is required");
        return nullptr;
    }
    try {
        return new tokenward_refresher{std::make_shared<TokenRefresher>(client->client)};
    } catch (...) {
        translate_current_exception();
        return nullptr;
    }
}

void tokenward_refresher_destroy(tokenward_refresher* refresher) {
    delete refresher;
}

tokenward_error tokenward_refresher_wait(tokenward_refresher* refresher, const char* key) {
    clear_error();
    if (!refresher || !key) {
        set_error("refresher and key are required");
        return TOKENWARD_ERROR_INVALID_ARGUMENT;
    }
    try {
        refresher->refresher->wait_for_refresh(key);
        return TOKENWARD_OK;
    } catch (...) {
        return translate_current_exception();
    }
}

tokenward_error tokenward_refresher_get_access_token(
    tokenward_refresher* refresher,
    const char* key,
    char** access_token
) {
    clear_error();
    if (!refresher || !key || !access_token) {
        set_error("refresher, key and access_token are required");
        return TOKENWARD_ERROR_INVALID_ARGUMENT;
    }

    *access_token = nullptr;
    try {
        Token token = refresher->refresher->get_valid_token(key);
        *access_token = copy_string(token.access_token);
        return TOKENWARD_OK;
    } catch (...) {
        return translate_current_exception();
    }
}

void tokenward_string_free(char* value) {
    delete[] value;
}

} // extern "C"
