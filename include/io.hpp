#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

// Where `print` and `prompt` text goes. Writes keep their order; no other
// buffering guarantee.
class OutputSink {
   public:
    virtual ~OutputSink() = default;
    virtual void write(const std::string& text) = 0;
};

// Where `prompt` waits for a line. nullopt means the input is exhausted.
class InputSource {
   public:
    virtual ~InputSource() = default;
    virtual std::optional<std::string> read_line() = 0;
};

class StreamOutput : public OutputSink {
   public:
    explicit StreamOutput(std::ostream& out) : out_(out) {}
    void write(const std::string& text) override;

   private:
    std::ostream& out_;
};

class StreamInput : public InputSource {
   public:
    explicit StreamInput(std::istream& in) : in_(in) {}
    std::optional<std::string> read_line() override;

   private:
    std::istream& in_;
};

// Blocking line reader over fd 0 built on a private libuv loop. Works for
// terminals, pipes and redirected files; bytes read past a newline are kept
// for the next call.
class UvStdinInput : public InputSource {
   public:
    UvStdinInput();
    ~UvStdinInput() override;
    UvStdinInput(const UvStdinInput&) = delete;
    UvStdinInput& operator=(const UvStdinInput&) = delete;

    std::optional<std::string> read_line() override;

    struct State;  // libuv handles, defined in stdin_input.cc

   private:
    std::unique_ptr<State> state_;
};
