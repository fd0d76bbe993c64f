#pragma once
/*
 * Highlighter
 *
 * Purpose: background syntax highlighting. The editor thread submits text
 * snapshots tagged with the buffer revision; a single worker parses the
 * newest one and publishes an immutable result.
 * Concurrency: submit() never waits for a parse; a pending job that was not
 * started yet is replaced (last write wins). Readers take a shared_ptr copy
 * of the published result under the mutex and never see a partial one.
 */
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "syntax.hpp"
#include "types.hpp"

struct HighlightResult {
  uint64_t version = 0;
  size_t length = 0;
  std::string language;
  std::vector<HighlightSpan> spans;
};

struct HighlightStatus {
  EditError error = EditError::None;
  uint64_t version = 0; // job the status refers to
  std::string message;
};

class Highlighter {
public:
  Highlighter();
  ~Highlighter();
  Highlighter(const Highlighter&) = delete;
  Highlighter& operator=(const Highlighter&) = delete;

  /* applies to jobs submitted afterwards */
  void set_language(const Language& lang);
  const Language& language() const;
  void submit(std::string snapshot, uint64_t version);

  std::shared_ptr<const HighlightResult> current() const;
  HighlightStatus status() const;
  uint64_t processed_version() const;
  size_t parses_run() const;
  /* true once a job with version >= `version` has been processed */
  bool wait_for(uint64_t version, std::chrono::milliseconds timeout) const;

private:
  struct Job {
    std::string text;
    uint64_t version = 0;
    const Language* lang = nullptr;
  };

  mutable std::mutex mu_;
  std::condition_variable work_cv_;
  mutable std::condition_variable done_cv_;
  std::optional<Job> pending_;
  const Language* lang_;
  std::shared_ptr<const HighlightResult> result_;
  HighlightStatus status_;
  uint64_t submitted_ = 0;
  uint64_t processed_ = 0;
  size_t parses_ = 0;
  bool stop_ = false;
  std::thread worker_;

  void worker_loop();
};
