/**
 * hellosvc Server Process Tests
 *
 * Runs the hello_server binary as a child process and checks how it
 * reacts to shutdown signals.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace hellosvc::testing;

#ifndef HELLOSVC_SERVER_BINARY
#error "HELLOSVC_SERVER_BINARY must name the hello_server executable"
#endif

// =============================================================================
// Child Process Fixture
// =============================================================================

class HelloServerProcessTest : public HelloSvcTest {
protected:
    std::string dir_;
    std::string fifo_;
    pid_t child_ = -1;

    void SetUp() override {
        HelloSvcTest::SetUp();
        char path[] = "/tmp/hellosvc_proc_XXXXXX";
        ASSERT_NE(::mkdtemp(path), nullptr);
        dir_ = path;
        fifo_ = dir_ + "/.env";
        ASSERT_EQ(::mkfifo(fifo_.c_str(), 0600), 0);
    }

    void TearDown() override {
        if (child_ > 0) {
            ::kill(child_, SIGKILL);
            ::waitpid(child_, nullptr, 0);
        }
        ::unlink(fifo_.c_str());
        ::rmdir(dir_.c_str());
        HelloSvcTest::TearDown();
    }

    // Start hello_server in dir_ with an empty environment and quiet output
    void spawn() {
        child_ = ::fork();
        ASSERT_GE(child_, 0);
        if (child_ == 0) {
            int devnull = ::open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
            }
            if (::chdir(dir_.c_str()) != 0) {
                ::_exit(127);
            }
            char* const argv[] = {const_cast<char*>(HELLOSVC_SERVER_BINARY), nullptr};
            char* const envp[] = {nullptr};
            ::execve(HELLOSVC_SERVER_BINARY, argv, envp);
            ::_exit(127);
        }
    }

    // waitpid with a deadline; returns false if the child is still running
    bool wait_exit(int* status, int timeout_ms) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            pid_t done = ::waitpid(child_, status, WNOHANG);
            if (done == child_) {
                child_ = -1;
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

// =============================================================================
// Shutdown Signals
// =============================================================================

TEST_F(HelloServerProcessTest, SigtermWhileReadingEnvFileExitsZero) {
    spawn();

    // Opening the FIFO for write blocks until the server opens .env
    int writer = ::open(fifo_.c_str(), O_WRONLY);
    ASSERT_GE(writer, 0);

    ASSERT_EQ(::kill(child_, SIGTERM), 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const std::string env = "HOST=127.0.0.1\nPORT=0\n";
    EXPECT_EQ(::write(writer, env.data(), env.size()), static_cast<ssize_t>(env.size()));
    ::close(writer);

    int status = 0;
    ASSERT_TRUE(wait_exit(&status, 5000));
    ASSERT_TRUE(WIFEXITED(status)) << "terminated by signal " << WTERMSIG(status);
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(HelloServerProcessTest, SigintWhileServingExitsZero) {
    spawn();

    int writer = ::open(fifo_.c_str(), O_WRONLY);
    ASSERT_GE(writer, 0);
    const std::string env = "HOST=127.0.0.1\nPORT=0\n";
    EXPECT_EQ(::write(writer, env.data(), env.size()), static_cast<ssize_t>(env.size()));
    ::close(writer);

    // Give it time to bind and enter the event loop
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ASSERT_EQ(::kill(child_, SIGINT), 0);

    int status = 0;
    ASSERT_TRUE(wait_exit(&status, 5000));
    ASSERT_TRUE(WIFEXITED(status)) << "terminated by signal " << WTERMSIG(status);
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
