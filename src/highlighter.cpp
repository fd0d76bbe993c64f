#include "highlighter.hpp"
#include <chrono>
#include <glog/logging.h>

Highlighter::Highlighter()
    : lang_(&plain_text_language()), result_(std::make_shared<const HighlightResult>()) {
  worker_ = std::thread([this] { worker_loop(); });
}

Highlighter::~Highlighter() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  work_cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  LOG(INFO) << "highlight worker stopped after " << parses_ << " parses";
}

void Highlighter::set_language(const Language& lang) {
  std::lock_guard<std::mutex> lk(mu_);
  lang_ = &lang;
}

const Language& Highlighter::language() const {
  std::lock_guard<std::mutex> lk(mu_);
  return *lang_;
}

void Highlighter::submit(std::string snapshot, uint64_t version) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (version < submitted_) return;
    if (pending_) VLOG(2) << "highlight job " << pending_->version << " superseded by " << version;
    pending_ = Job{std::move(snapshot), version, lang_};
    submitted_ = version;
  }
  work_cv_.notify_one();
}

std::shared_ptr<const HighlightResult> Highlighter::current() const {
  std::lock_guard<std::mutex> lk(mu_);
  return result_;
}

HighlightStatus Highlighter::status() const {
  std::lock_guard<std::mutex> lk(mu_);
  return status_;
}

uint64_t Highlighter::processed_version() const {
  std::lock_guard<std::mutex> lk(mu_);
  return processed_;
}

size_t Highlighter::parses_run() const {
  std::lock_guard<std::mutex> lk(mu_);
  return parses_;
}

bool Highlighter::wait_for(uint64_t version, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return done_cv_.wait_for(lk, timeout, [&] { return processed_ >= version; });
}

void Highlighter::worker_loop() {
  LOG(INFO) << "highlight worker started";
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      work_cv_.wait(lk, [&] { return stop_ || pending_.has_value(); });
      if (stop_) return;
      job = std::move(*pending_);
      pending_.reset();
    }

    auto t0 = std::chrono::steady_clock::now();
    SyntaxTree tree;
    std::string msg;
    bool ok = parse_syntax(job.text, *job.lang, tree, msg);
    std::shared_ptr<const HighlightResult> res;
    if (ok) {
      auto r = std::make_shared<HighlightResult>();
      r->version = job.version;
      r->length = job.text.size();
      r->language = job.lang->name;
      r->spans = assign_categories(job.text, *job.lang, tree);
      std::chrono::duration<double, std::milli> dt = std::chrono::steady_clock::now() - t0;
      VLOG(1) << "highlight v" << job.version << " " << job.lang->name << " bytes=" << r->length
              << " spans=" << r->spans.size() << " took " << dt.count() << "ms";
      res = std::move(r);
    } else {
      LOG(WARNING) << "highlight parse failed for version " << job.version << ": " << msg
                   << "; keeping previous result";
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      ++parses_;
      if (res) {
        result_ = std::move(res);
        status_ = HighlightStatus{EditError::None, job.version, ""};
      } else {
        status_ = HighlightStatus{EditError::ParseFailure, job.version, msg};
      }
      processed_ = job.version;
    }
    done_cv_.notify_all();
  }
}
