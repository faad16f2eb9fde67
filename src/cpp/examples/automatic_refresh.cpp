/**
 * @file automatic_refresh.cpp
 * @brief Authorize once, then let the refresher keep the token valid
 */

#include <tokenward/tokenward.hpp>
#include <cstdlib>
#include <iostream>

using namespace tokenward;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <github-client-id> [client-secret]\n";
        return 2;
    }

    try {
        Settings settings = load_settings_from_env();
        set_log_level(settings.log_level);

        std::string root = settings.storage_dir.value_or(default_storage_path("tokenward-example"));
        auto storage = std::make_shared<FileStorage>(root);
        std::cout << "Storing credentials in " << root << "\n\n";

        OAuthConfig config = OAuthConfig::github(argv[1]);
        config.scope = "repo read:user";
        if (argc > 2) {
            config.client_secret = argv[2];
        }
        auto client = std::make_shared<OAuthClient>(config, storage, std::make_shared<CurlTransport>());

        RefresherOptions options;
        options.lock_timeout = settings.lock_timeout;
        TokenRefresher refresher(client, options);

        if (!client->get_token("github")) {
            client->authorize("github", std::chrono::minutes(5), [](const std::string& url) {
                std::cout << "Open this URL in a browser:\n  " << url << "\n\n";
            });
            std::cout << "Authorized.\n";
        }

        // Refreshes once 80% of the lifetime has elapsed
        Token token = refresher.get_valid_token_with_threshold("github", 0.8);
        std::cout << "Access token: " << mask_secret(token.access_token) << "\n";
        if (token.expires_at) {
            std::cout << "Expires in " << (*token.expires_at - unix_now()) << "s\n";
        }

    } catch (const TokenEndpointError& e) {
        std::cerr << "Token endpoint error (" << e.status_code() << " " << e.error_code() << "): "
                  << e.what() << "\n";
        return 1;
    } catch (const TokenwardError& e) {
        std::cerr << "tokenward error [" << e.code() << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
