#include "progress.hpp"
#include "errors.hpp"

#include <utility>

namespace conz {

Progress::Progress(Printer printer, const Color& color,
                   std::string done, std::string fail, std::string tick)
    : printer_(std::move(printer)),
      color_(color),
      done_(std::move(done)),
      fail_(std::move(fail)),
      tick_(std::move(tick)) {}

void Progress::resolve(State state, const std::string& banner, const std::function<void()>& post) {
    if (resolved()) {
        throw ProgressMisuse("Progress step already ended with " +
                             std::string(state_ == State::succeeded ? "success" : "abort"));
    }
    printer_(banner, "\n");
    state_ = state;
    if (post) {
        post();
    }
}

void Progress::succeed(const std::string& message, const std::function<void()>& post, bool no_signal) {
    resolve(State::succeeded, color_.green(message.empty() ? done_ : message), post);
    if (no_signal) {
        return;
    }
    throw ProgressOK();
}

void Progress::abort(const std::string& message, const std::function<void()>& post, bool no_signal) {
    resolve(State::aborted, color_.red(message.empty() ? fail_ : message), post);
    if (no_signal) {
        return;
    }
    throw ProgressAbort();
}

void Progress::tick(const std::string& mark) {
    printer_(mark.empty() ? tick_ : mark, "");
}

} // namespace conz
