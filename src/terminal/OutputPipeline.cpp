#include "OutputPipeline.hpp"

#include "Utf8Splitter.hpp"

namespace wb {
bool sendOutputChunk(OutputChannel *channel, string data) {
  switch (channel->trySend(data)) {
    case SendStatus::SENT:
      return true;
    case SendStatus::FULL:
      // Backpressure: the emitter is behind, wait for it instead of dropping
      return channel->send(std::move(data));
    default:
      return false;
  }
}

OutputPipeline::OutputPipeline(const string &_sessionId,
                               shared_ptr<UserTerminal> _terminal,
                               shared_ptr<TerminalEventSink> _sink,
                               const PipelineOptions &_options,
                               EndOfStreamCallback _onEndOfStream)
    : sessionId(_sessionId),
      terminal(_terminal),
      sink(_sink),
      options(_options),
      onEndOfStream(_onEndOfStream),
      output(new OutputChannel(_options.channelCapacity)),
      pulses(new PulseChannel(0)),
      stopRequested(false),
      emitCount(0),
      runningThreads(0) {
  activityMonitor.reset(
      new ActivityMonitor(sessionId, pulses, sink, options.quietWindow));
}

OutputPipeline::~OutputPipeline() {
  requestStop();
  join();
}

void OutputPipeline::start() {
  lock_guard<mutex> guard(threadsMutex);
  runningThreads += 3;
  threads.emplace_back([this]() {
    el::Helpers::setThreadName("activity-" + sessionId);
    activityMonitor->run();
    runningThreads--;
  });
  threads.emplace_back([this]() {
    el::Helpers::setThreadName("reader-" + sessionId);
    runReader();
    runningThreads--;
  });
  threads.emplace_back([this]() {
    el::Helpers::setThreadName("emitter-" + sessionId);
    runEmitter();
    runningThreads--;
  });
}

void OutputPipeline::runAfter(Millis delay, std::function<void()> task) {
  lock_guard<mutex> guard(threadsMutex);
  runningThreads++;
  threads.emplace_back([this, delay, task]() {
    std::this_thread::sleep_for(delay);
    task();
    runningThreads--;
  });
}

bool OutputPipeline::isFinished() {
  lock_guard<mutex> guard(threadsMutex);
  return !threads.empty() && runningThreads == 0;
}

void OutputPipeline::join() {
  vector<thread> toJoin;
  {
    lock_guard<mutex> guard(threadsMutex);
    toJoin.swap(threads);
  }
  for (auto &it : toJoin) {
    if (!it.joinable()) {
      continue;
    }
    if (it.get_id() == std::this_thread::get_id()) {
      // The last owner let go from inside the pipeline, nothing to wait for
      it.detach();
      continue;
    }
    it.join();
  }
}

void OutputPipeline::runReader() {
  vector<char> buf(options.readBufferSize);
  Utf8Splitter splitter;
  while (!stopRequested) {
    ssize_t rc = terminal->readOutput(&buf[0], buf.size(), options.readPollMs);
    if (rc == UserTerminal::READ_TIMEOUT) {
      continue;
    }
    if (rc == 0) {
      VLOG(1) << "Terminal output ended for " << sessionId;
      break;
    }
    if (rc < 0) {
      // Linux reports EIO here once the shell side of the pty is closed
      VLOG(1) << "Terminal read for " << sessionId
              << " stopped: " << strerror(GetErrno());
      break;
    }
    string text = splitter.push(&buf[0], size_t(rc));
    if (text.empty()) {
      continue;
    }
    if (!sendOutputChunk(output.get(), std::move(text))) {
      VLOG(1) << "Output channel for " << sessionId << " closed";
      break;
    }
  }
  if (!splitter.pending().empty()) {
    VLOG(1) << "Discarding " << splitter.pending().size()
            << " bytes of an incomplete character for " << sessionId;
  }
  if (splitter.getDroppedBytes() > 0) {
    LOG(INFO) << "Dropped " << splitter.getDroppedBytes()
              << " invalid UTF-8 bytes from " << sessionId;
  }
  output->close();
}

void OutputPipeline::drainInto(string *batch) {
  while (true) {
    auto data = output->tryReceive();
    if (!data) {
      return;
    }
    batch->append(*data);
  }
}

void OutputPipeline::emitBatch(string *batch) {
  TerminalDataEvent event;
  event.sessionId = sessionId;
  event.data.swap(*batch);
  pulses->send(ActivityPulse());
  emitCount++;
  emitBestEffort(sink, event, &TerminalEventSink::onData);
}

void OutputPipeline::runEmitter() {
  string batch;
  auto lastEmit = std::chrono::steady_clock::now();

  while (true) {
    auto first = output->receive();
    if (!first) {
      break;
    }
    batch.append(*first);
    drainInto(&batch);

    // Output is streaming, give the reader a moment to queue more so the
    // sink sees fewer, larger batches.
    if (std::chrono::steady_clock::now() - lastEmit < options.fastThreshold) {
      std::this_thread::sleep_for(options.coalesceYield);
      drainInto(&batch);
    }

    if (!batch.empty()) {
      emitBatch(&batch);
      lastEmit = std::chrono::steady_clock::now();
    }
  }

  drainInto(&batch);
  if (!batch.empty()) {
    emitBatch(&batch);
  }
  pulses->close();

  if (onEndOfStream) {
    onEndOfStream(sessionId);
  }
}
}  // namespace wb
