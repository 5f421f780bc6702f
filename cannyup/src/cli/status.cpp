#include "status.hpp"

namespace cannyup::cli {

void StatusReporter::line(std::ostream& os, const char* color, const std::string& message) {
    if (colors_) {
        os << color << "==> " << message << "\033[0m\n";
    } else {
        os << "==> " << message << "\n";
    }
    os.flush();
}

void StatusReporter::info(const std::string& message) {
    line(out_, "\033[1;34m", message);
}

void StatusReporter::success(const std::string& message) {
    line(out_, "\033[1;32m", message);
}

void StatusReporter::warn(const std::string& message) {
    line(out_, "\033[1;33m", message);
}

void StatusReporter::fatal(const Error& error) {
    out_.flush();
    line(err_, "\033[1;31m", std::string("error: ") + error.message);
    if (!error.hint.empty()) {
        err_ << "    hint: " << error.hint << "\n";
    }
}

void StatusReporter::note(const std::string& message) {
    out_ << "    " << message << "\n";
}

} // namespace cannyup::cli
