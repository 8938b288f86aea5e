#ifndef TEXT_SERVICE_HPP
#define TEXT_SERVICE_HPP

#include "core/config.hpp"
#include "dictionary/dictionary_loader.hpp"
#include "dictionary/dictionary_snapshot.hpp"
#include "dictionary/dictionary_store.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <string>
#include <string_view>

// Entry points used by the transport layer. Every call works against the
// snapshot that was current when it started.
class TextService {
public:
  TextService(Dictionary::DictionaryStore &store,
              const Config::AppConfig &config);

  bool exists(std::string_view text) const;
  // True when the text contains no dictionary word.
  bool validate(std::string_view text) const;
  // Masks with the character the current dictionary was built for.
  std::string filter(std::string_view text) const;

  // Throws Dictionary::LoadError; the previous dictionary stays in effect.
  size_t reload(const std::string &pattern);
  size_t reload();

  void reconfigure(const Config::AppConfig &config);

  std::shared_ptr<const Dictionary::DictionarySnapshot> snapshot() const;
  std::string dictionary_pattern() const;

private:
  bool timed_exists(std::string_view text, const char *method) const;

  Dictionary::DictionaryStore &store_;

  mutable std::mutex settings_mutex_;
  std::string pattern_;
  Dictionary::LoaderOptions loader_options_;

  std::atomic<bool> log_request_text_;

  prometheus::Counter &exists_requests_;
  prometheus::Counter &validate_requests_;
  prometheus::Counter &filter_requests_;
  prometheus::Counter &matched_requests_;
  prometheus::Counter &reload_success_;
  prometheus::Counter &reload_failure_;
  prometheus::Gauge &dictionary_words_;
  prometheus::Histogram &scan_duration_;
};

#endif // TEXT_SERVICE_HPP
