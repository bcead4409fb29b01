#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "io.hpp"

namespace fs = std::filesystem;

// Swaps fd 0 for another descriptor while a test runs.
class StdinRedirectTest : public ::testing::Test {
   protected:
    void SetUp() override {
        saved_stdin = dup(STDIN_FILENO);
        ASSERT_GE(saved_stdin, 0);
    }

    void TearDown() override {
        dup2(saved_stdin, STDIN_FILENO);
        close(saved_stdin);
    }

    void redirect(int fd) {
        ASSERT_GE(dup2(fd, STDIN_FILENO), 0);
        close(fd);
    }

    int saved_stdin = -1;
};

TEST_F(StdinRedirectTest, PipeKeepsBytesAfterNewline) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    const std::string data = "a\nb";
    ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    close(fds[1]);
    redirect(fds[0]);

    UvStdinInput in;
    auto first = in.read_line();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "a");
    auto second = in.read_line();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "b");
    EXPECT_FALSE(in.read_line().has_value());
}

TEST_F(StdinRedirectTest, RegularFileIsReadLineByLine) {
    fs::path file = fs::temp_directory_path() / "clarice_stdin_test.txt";
    {
        std::ofstream out(file);
        out << "first\r\nsecond\nthird";
    }
    int fd = open(file.c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);
    redirect(fd);

    {
        UvStdinInput in;
        EXPECT_EQ(in.read_line().value_or("<none>"), "first");
        EXPECT_EQ(in.read_line().value_or("<none>"), "second");
        EXPECT_EQ(in.read_line().value_or("<none>"), "third");
        EXPECT_FALSE(in.read_line().has_value());
        EXPECT_FALSE(in.read_line().has_value());
    }
    fs::remove(file);
}

TEST_F(StdinRedirectTest, EmptyInputIsEndOfInput) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[1]);
    redirect(fds[0]);

    UvStdinInput in;
    EXPECT_FALSE(in.read_line().has_value());
}
