#include <io/output_target.hpp>
#include <core/errors.hpp>

namespace Polydoc {

OutputTarget OutputTarget::to_path(std::string path) {
    OutputTarget t;
    t.path_ = std::move(path);
    return t;
}

OutputTarget OutputTarget::to_stream(std::ostream& out) {
    OutputTarget t;
    t.stream_ = &out;
    return t;
}

OutputTarget::OutputTarget(OutputTarget&&) noexcept = default;
OutputTarget& OutputTarget::operator=(OutputTarget&&) noexcept = default;
OutputTarget::~OutputTarget() = default;

std::ostream& OutputTarget::stream() {
    if (stream_) return *stream_;
    if (!file_) {
        file_ = std::make_unique<std::ofstream>(*path_, std::ios::binary | std::ios::trunc);
        if (!*file_) {
            file_.reset();
            throw Error("Cannot open output file: " + *path_, *path_);
        }
    }
    return *file_;
}

void OutputTarget::write(std::string_view data) {
    stream().write(data.data(), static_cast<std::streamsize>(data.size()));
}

void OutputTarget::flush() {
    auto& out = stream();
    out.flush();
    if (!out) throw Error("Write failed: " + describe(), describe());
}

} // namespace Polydoc
