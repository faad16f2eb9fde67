#include <gtest/gtest.h>

#include <tokenward/errors.hpp>
#include <tokenward/file_storage.hpp>
#include <tokenward/refresher.hpp>
#include "support/test_support.hpp"
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <fstream>
#include <thread>
#include <vector>

using namespace tokenward;
using namespace tokenward::tests;

/**
 * @brief Token endpoint that records every call as one line in a shared file
 */
class CallLogTransport : public Transport {
public:
    CallLogTransport(std::string log_path, std::chrono::milliseconds delay)
        : log_path_(std::move(log_path)), delay_(delay) {}

    HttpResponse execute(const HttpRequest&) override {
        const std::string line = std::to_string(getpid()) + "\n";
        int fd = open(log_path_.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
        if (fd < 0 || write(fd, line.data(), line.size()) != static_cast<ssize_t>(line.size())) {
            throw TransportError("call log unavailable", log_path_);
        }
        close(fd);

        std::this_thread::sleep_for(delay_);

        HttpResponse response;
        response.status_code = 200;
        response.body = json{
            {"access_token", "access-" + std::to_string(getpid())},
            {"expires_in", 3600}
        }.dump();
        return response;
    }

private:
    std::string log_path_;
    std::chrono::milliseconds delay_;
};

class CrossProcessRefreshTest : public ::testing::Test {
protected:
    enum class Mode { Expired, Forced };

    // Returns the exit status of the refresh run in a child process
    static int run_child(int gate_fd, const std::string& root, const std::string& log, Mode mode) {
        char byte;
        // Blocks until the parent closes the write end
        if (read(gate_fd, &byte, 1) < 0) {
            return 3;
        }
        try {
            auto storage = std::make_shared<FileStorage>(root);
            auto transport = std::make_shared<CallLogTransport>(log, std::chrono::milliseconds(300));
            auto client = std::make_shared<OAuthClient>(test_config(), storage, transport);
            TokenRefresher refresher(client);

            Token token = mode == Mode::Expired ? refresher.get_valid_token("github")
                                                : refresher.refresh_token_for_key("github");
            return token.access_token.rfind("access-", 0) == 0 ? 0 : 1;
        } catch (const std::exception&) {
            return 2;
        }
    }

    void run_children(Mode mode, const std::string& observed_access_token) {
        const std::string root = dir_.child("store");
        const std::string log = dir_.child("calls.log");

        FileStorage storage(root);
        storage.save_token("github", make_token(observed_access_token, 3600,
                                                mode == Mode::Expired ? 3700 : 0));

        int gate[2];
        ASSERT_EQ(pipe(gate), 0);

        std::vector<pid_t> children;
        for (int i = 0; i < 2; ++i) {
            pid_t pid = fork();
            ASSERT_GE(pid, 0);
            if (pid == 0) {
                close(gate[1]);
                _exit(run_child(gate[0], root, log, mode));
            }
            children.push_back(pid);
        }

        close(gate[0]);
        close(gate[1]);

        for (pid_t pid : children) {
            int status = 0;
            ASSERT_EQ(waitpid(pid, &status, 0), pid);
            ASSERT_TRUE(WIFEXITED(status));
            EXPECT_EQ(WEXITSTATUS(status), 0);
        }

        std::ifstream calls(log);
        std::vector<std::string> lines;
        for (std::string line; std::getline(calls, line);) {
            lines.push_back(line);
        }
        EXPECT_EQ(lines.size(), 1u);

        auto stored = storage.get_token("github");
        ASSERT_TRUE(stored.has_value());
        ASSERT_EQ(lines.size(), 1u);
        EXPECT_EQ(stored->access_token, "access-" + lines[0]);
    }

    TempDirectory dir_;
};

TEST_F(CrossProcessRefreshTest, ExpiredToken_TwoProcesses_OneRefresh) {
    run_children(Mode::Expired, "at-expired");
}

TEST_F(CrossProcessRefreshTest, ForcedRefresh_TwoProcesses_OneRefresh) {
    run_children(Mode::Forced, "at-current");
}

// ============================================================================
// wait_for_refresh against a lock held by another process
// ============================================================================

TEST_F(CrossProcessRefreshTest, WaitForRefresh_BlocksWhileOtherProcessHoldsLock) {
    using namespace std::chrono_literals;
    const std::string root = dir_.child("store");
    auto storage = std::make_shared<FileStorage>(root);

    int ready[2];
    ASSERT_EQ(pipe(ready), 0);

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        close(ready[0]);
        int status = 0;
        try {
            auto held = FileStorage(root).acquire_refresh_lock("github", 1000ms);
            const char byte = 'L';
            if (write(ready[1], &byte, 1) != 1) {
                status = 3;
            }
            std::this_thread::sleep_for(300ms);
        } catch (const std::exception&) {
            status = 2;
        }
        // Exit releases the flock with the descriptor
        _exit(status);
    }

    close(ready[1]);
    char byte = 0;
    ASSERT_EQ(read(ready[0], &byte, 1), 1);
    close(ready[0]);

    auto client = std::make_shared<OAuthClient>(test_config(), storage,
                                                std::make_shared<CallLogTransport>(dir_.child("calls.log"), 0ms));
    TokenRefresher refresher(client);

    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(refresher.wait_for_refresh_for("github", 50ms));
    refresher.wait_for_refresh("github");
    EXPECT_GE(std::chrono::steady_clock::now() - started, 200ms);

    EXPECT_TRUE(refresher.wait_for_refresh_for("github", 50ms));

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
