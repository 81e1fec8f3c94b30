#include "optcb/actions/log_progress.hpp"

#include <iomanip>
#include <ios>
#include <limits>
#include <string>

namespace optcb::actions {

namespace {
// Same layout as printf("%11.6g").
void write_number(std::ostream& stream, Scalar number) {
    stream << std::setw(11) << std::setprecision(6) << number;
}

}  // namespace

LogProgress::LogProgress(std::ostream& stream) : stream_{&stream} {}

void LogProgress::write_header() {
    *stream_ << " eval   | current     | lowest      | highest     " << '\n';
    *stream_ << std::string(49, '_') << '\n';
}

void LogProgress::apply(const OptimizationState& /*state*/, Scalar value, Iteration t, const Extra& /*extra*/) {
    if (count_ % kHeaderEvery == 0) {
        write_header();
    }
    ++count_;
    if (value <= lowest_) {
        lowest_ = value;
    }
    if (value >= highest_) {
        highest_ = value;
    }

    auto& stream = *stream_;
    const auto flags = stream.flags();
    const auto precision = stream.precision();
    stream.unsetf(std::ios::floatfield);
    stream << std::right << std::setw(7) << t << " | ";
    write_number(stream, value);
    stream << " | ";
    write_number(stream, lowest_);
    stream << " | ";
    write_number(stream, highest_);
    stream << '\n';
    stream.flush();
    stream.flags(flags);
    stream.precision(precision);
}

void LogProgress::reset() {
    count_ = 0;
    lowest_ = std::numeric_limits<Scalar>::infinity();
    highest_ = -std::numeric_limits<Scalar>::infinity();
}

}  // namespace optcb::actions
