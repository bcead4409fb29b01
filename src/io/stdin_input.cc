#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

#include "io.hpp"
#include "uv.h"

struct UvStdinInput::State {
    uv_loop_t loop;
    uv_handle_type kind = UV_UNKNOWN_HANDLE;
    uv_stream_t* stream = nullptr;  // uv_tty_t or uv_pipe_t for terminals and pipes
    std::string pending;            // bytes read but not yet returned
    bool eof = false;
    int read_error = 0;
};

static void stdin_alloc_cb(uv_handle_t*, size_t suggested, uv_buf_t* buf) {
    buf->base = static_cast<char*>(malloc(suggested));
    buf->len = static_cast<unsigned int>(suggested);
}

static void stdin_read_cb(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    auto* st = static_cast<UvStdinInput::State*>(stream->data);
    if (nread > 0) {
        st->pending.append(buf->base, static_cast<size_t>(nread));
        if (st->pending.find('\n') != std::string::npos) uv_read_stop(stream);
    } else if (nread < 0) {
        if (nread != UV_EOF) st->read_error = static_cast<int>(nread);
        st->eof = true;
        uv_read_stop(stream);
    }
    free(buf->base);
}

UvStdinInput::UvStdinInput() : state_(new State) {
    int r = uv_loop_init(&state_->loop);
    if (r != 0) {
        throw std::runtime_error(std::string("uv_loop_init failed: ") + uv_strerror(r));
    }
    state_->kind = uv_guess_handle(0);

    if (state_->kind == UV_TTY) {
        auto* tty = new uv_tty_t;
        r = uv_tty_init(&state_->loop, tty, 0, 1);
        if (r != 0) {
            delete tty;
            uv_loop_close(&state_->loop);
            throw std::runtime_error(std::string("uv_tty_init failed: ") + uv_strerror(r));
        }
        state_->stream = reinterpret_cast<uv_stream_t*>(tty);
    } else if (state_->kind == UV_NAMED_PIPE) {
        auto* pipe = new uv_pipe_t;
        uv_pipe_init(&state_->loop, pipe, 0);
        r = uv_pipe_open(pipe, 0);
        if (r != 0) {
            // the pipe handle is already registered with the loop
            uv_close(reinterpret_cast<uv_handle_t*>(pipe), [](uv_handle_t* h) { delete reinterpret_cast<uv_pipe_t*>(h); });
            uv_run(&state_->loop, UV_RUN_DEFAULT);
            uv_loop_close(&state_->loop);
            throw std::runtime_error(std::string("uv_pipe_open failed: ") + uv_strerror(r));
        }
        state_->stream = reinterpret_cast<uv_stream_t*>(pipe);
    }
    if (state_->stream) state_->stream->data = state_.get();
}

UvStdinInput::~UvStdinInput() {
    if (state_->stream) {
        uv_close(reinterpret_cast<uv_handle_t*>(state_->stream), [](uv_handle_t* h) {
            if (h->type == UV_TTY)
                delete reinterpret_cast<uv_tty_t*>(h);
            else
                delete reinterpret_cast<uv_pipe_t*>(h);
        });
        uv_run(&state_->loop, UV_RUN_DEFAULT);
    }
    uv_loop_close(&state_->loop);
}

std::optional<std::string> UvStdinInput::read_line() {
    State& st = *state_;

    while (st.pending.find('\n') == std::string::npos && !st.eof) {
        if (st.stream) {
            int r = uv_read_start(st.stream, stdin_alloc_cb, stdin_read_cb);
            if (r != 0) {
                throw std::runtime_error(std::string("cannot read stdin: ") + uv_strerror(r));
            }
            uv_run(&st.loop, UV_RUN_DEFAULT);
        } else {
            // regular files (and anything else libuv cannot watch): plain fs reads
            char chunk[4096];
            uv_buf_t buf = uv_buf_init(chunk, sizeof(chunk));
            uv_fs_t req;
            int n = uv_fs_read(&st.loop, &req, 0, &buf, 1, -1, nullptr);
            uv_fs_req_cleanup(&req);
            if (n < 0) st.read_error = n;
            if (n <= 0) {
                st.eof = true;
            } else {
                st.pending.append(chunk, static_cast<size_t>(n));
            }
        }
        if (st.read_error != 0) {
            int err = st.read_error;
            st.read_error = 0;
            throw std::runtime_error(std::string("cannot read stdin: ") + uv_strerror(err));
        }
    }

    size_t nl = st.pending.find('\n');
    if (nl == std::string::npos) {
        if (st.pending.empty()) return std::nullopt;
        std::string last;
        last.swap(st.pending);
        return last;
    }
    std::string line = st.pending.substr(0, nl);
    st.pending.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}
