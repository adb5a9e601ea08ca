#include "updater/confirmation.hpp"

#include "system/signals.hpp"
#include "updater/progress_sinks.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>

namespace cursorup {

bool TerminalConfirmation::Confirm(const std::string& question) {
    ClearProgressLine();
    std::fprintf(out_, "%s (y/N): ", question.c_str());
    std::fflush(out_);

    char buf[64]{};
    if (!std::fgets(buf, sizeof(buf), in_) || CancelRequested()) {
        std::fprintf(out_, "\n");
        return false;
    }

    std::string answer = TrimWhitespace(buf);
    std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return answer == "y" || answer == "yes";
}

} // namespace cursorup
