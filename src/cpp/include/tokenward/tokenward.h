/**
 * @file tokenward.h
 * @brief C interface to tokenward
 *
 * Every function that can fail returns a tokenward_error and records a
 * message retrievable with tokenward_last_error_message() on the same thread.
 * Handles share ownership of what they were built from, so they may be
 * destroyed in any order. Destroy and free functions accept NULL.
 */

#ifndef TOKENWARD_H
#define TOKENWARD_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    TOKENWARD_OK = 0,
    TOKENWARD_ERROR_OUT_OF_MEMORY = 1,
    TOKENWARD_ERROR_INVALID_ARGUMENT = 2,
    TOKENWARD_ERROR_NOT_FOUND = 3,
    TOKENWARD_ERROR_UNKNOWN = 99
} tokenward_error;

typedef struct tokenward_storage tokenward_storage;
typedef struct tokenward_oauth tokenward_oauth;
typedef struct tokenward_refresher tokenward_refresher;

/**
 * Client configuration; scope may be NULL
 */
typedef struct {
    const char* client_id;
    const char* authorization_endpoint;
    const char* token_endpoint;
    const char* redirect_uri;
    const char* scope;
} tokenward_oauth_config;

/**
 * Started authorization flow, freed with tokenward_auth_flow_free()
 */
typedef struct {
    char* url;
    char* state;
} tokenward_auth_flow;

/** Library version, static storage */
const char* tokenward_version(void);

/** Message for the last failure on this thread, or "" */
const char* tokenward_last_error_message(void);

/* Storage */
tokenward_storage* tokenward_storage_memory_create(void);
tokenward_storage* tokenward_storage_file_create(const char* path);
void tokenward_storage_destroy(tokenward_storage* storage);

/* OAuth client, using the libcurl transport */
tokenward_oauth* tokenward_oauth_create(const tokenward_oauth_config* config, tokenward_storage* storage);
void tokenward_oauth_destroy(tokenward_oauth* client);

/**
 * Start an authorization code flow
 * @param result Filled on success; release with tokenward_auth_flow_free()
 */
tokenward_error tokenward_oauth_start_flow(tokenward_oauth* client, tokenward_auth_flow* result);
void tokenward_auth_flow_free(tokenward_auth_flow* result);

/* Refresher */
tokenward_refresher* tokenward_refresher_create(tokenward_oauth* client);
void tokenward_refresher_destroy(tokenward_refresher* refresher);

/**
 * Block until no refresh for key is in flight
 */
tokenward_error tokenward_refresher_wait(tokenward_refresher* refresher, const char* key);

/**
 * Valid access token for key, refreshing if expired
 * @param access_token Receives a string to release with tokenward_string_free()
 */
tokenward_error tokenward_refresher_get_access_token(
    tokenward_refresher* refresher,
    const char* key,
    char** access_token
);

void tokenward_string_free(char* value);

#ifdef __cplusplus
}
#endif

#endif /* TOKENWARD_H */
