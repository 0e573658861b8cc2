#ifndef __WB_OUTPUT_PIPELINE__
#define __WB_OUTPUT_PIPELINE__

#include "ActivityMonitor.hpp"
#include "Channel.hpp"
#include "Headers.hpp"
#include "TerminalEventSink.hpp"
#include "UserTerminal.hpp"

namespace wb {
/**
 * @brief Tuning for a session's reader/emitter pair.
 */
struct PipelineOptions {
  /** @brief Output chunks that may queue between reader and emitter. */
  size_t channelCapacity = 256;
  /** @brief Size of a single pty read. */
  size_t readBufferSize = 32 * 1024;
  /**
   * @brief When the previous batch went out less than this long ago the
   * emitter waits `coalesceYield` for more output before emitting.
   */
  Millis fastThreshold = Millis(8);
  Millis coalesceYield = Millis(2);
  /** @brief Silence after which a session counts as idle. */
  Millis quietWindow = Millis(1000);
  /** @brief How often a blocked reader checks for a stop request. */
  int readPollMs = 100;
};

typedef Channel<string> OutputChannel;

/**
 * @brief Queues a chunk without blocking if possible, otherwise waits for
 * room so output is throttled rather than dropped.
 * @return false when the consumer side is gone.
 */
bool sendOutputChunk(OutputChannel *channel, string data);

/**
 * @brief Streams one session's pty output to the event sink.
 *
 * The reader thread drains the terminal as fast as it produces output and
 * pushes complete UTF-8 text into a bounded channel. The emitter thread
 * takes everything queued, coalesces bursts, emits one data event per batch
 * and pulses the activity monitor. When the reader hits end of stream (or
 * is stopped) the emitter flushes and then invokes the end-of-stream
 * callback exactly once.
 */
class OutputPipeline {
 public:
  typedef std::function<void(const string &sessionId)> EndOfStreamCallback;

  OutputPipeline(const string &_sessionId, shared_ptr<UserTerminal> _terminal,
                 shared_ptr<TerminalEventSink> _sink,
                 const PipelineOptions &_options,
                 EndOfStreamCallback _onEndOfStream);

  /** @brief Joins every thread that was started. */
  ~OutputPipeline();

  /** @brief Starts the reader, emitter and activity threads. */
  void start();

  /**
   * @brief Runs `task` after `delay` on a helper thread owned by the
   * pipeline. Used for the startup command.
   */
  void runAfter(Millis delay, std::function<void()> task);

  /** @brief Makes the reader finish at its next poll, even without EOF. */
  void requestStop() { stopRequested = true; }

  /** @brief True once every pipeline thread has returned. */
  bool isFinished();

  /** @brief Waits for all threads. Must not be called from one of them. */
  void join();

  /** @brief Number of data events emitted so far. */
  int64_t getEmitCount() const { return emitCount; }

 protected:
  void runReader();
  void runEmitter();
  void emitBatch(string *batch);
  /** @brief Moves everything queued right now onto the end of `batch`. */
  void drainInto(string *batch);

  string sessionId;
  shared_ptr<UserTerminal> terminal;
  shared_ptr<TerminalEventSink> sink;
  PipelineOptions options;
  EndOfStreamCallback onEndOfStream;

  shared_ptr<OutputChannel> output;
  shared_ptr<PulseChannel> pulses;
  shared_ptr<ActivityMonitor> activityMonitor;

  atomic<bool> stopRequested;
  atomic<int64_t> emitCount;
  atomic<int> runningThreads;

  mutex threadsMutex;
  vector<thread> threads;
};
}  // namespace wb

#endif  // __WB_OUTPUT_PIPELINE__
