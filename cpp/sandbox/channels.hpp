#ifndef SANDBOX_CHANNELS_HPP
#define SANDBOX_CHANNELS_HPP

namespace sandbox {

// File descriptors of a worker process. The host creates them before the
// worker is started.
static const constexpr int kRequestFd = 0;
static const constexpr int kReportFd = 1;
static const constexpr int kDiagnosticsFd = 2;
static const constexpr int kStdoutFd = 3;
static const constexpr int kStderrFd = 4;
static const constexpr int kNumChannels = 5;

// Phase markers, written on kReportFd before the ExecutionReport message.
static const constexpr char kCompilingMarker = 'C';
static const constexpr char kRunningMarker = 'X';
static const constexpr char kSkippedMarker = 'S';

}  // namespace sandbox

#endif
