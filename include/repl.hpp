#pragma once
#include <ostream>
#include <string>

#include "config.hpp"
#include "evaluator.hpp"
#include "io.hpp"

// One interactive session: a persistent top-level scope fed one line at a
// time. Input that runs out mid-statement is kept and extended by the next
// line; anything else is evaluated as soon as it parses.
class ReplSession {
   public:
    enum class Status {
        Evaluated,  // buffer ran (or was blank); ready for a fresh statement
        NeedMore,   // buffer is an incomplete statement
        Failed      // error reported on diag; buffer discarded
    };

    ReplSession(OutputSink& out, InputSource& in, std::ostream& diag, bool color = false);

    Status feed_line(const std::string& line);

    bool has_pending_input() const { return !buffer_.empty(); }
    void discard_pending_input() { buffer_.clear(); }

    Evaluator& evaluator() { return evaluator_; }

   private:
    OutputSink& out_;
    std::ostream& diag_;
    bool color_;
    Evaluator evaluator_;
    std::string buffer_;
};

// Line-editing front end (linenoise) around a ReplSession on stdin/stdout.
void run_repl_mode(const CliConfig& cfg);
