#include "text_service.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "dictionary/text_filter.hpp"
#include "utils/scoped_timer.hpp"

#include <utility>
#include <vector>

namespace {

const std::vector<double> SCAN_DURATION_BUCKETS = {
    0.00001, 0.00005, 0.0001, 0.0005, 0.001, 0.005, 0.01, 0.05, 0.1, 0.5};

Dictionary::LoaderOptions make_loader_options(const Config::AppConfig &config) {
  Dictionary::LoaderOptions options;
  options.comment_prefix = config.dictionary.comment_prefix;
  options.mask_char = Config::mask_code_point(config.dictionary);
  options.require_files = config.dictionary.require_files;
  return options;
}

const char *bool_to_string(bool value) { return value ? "true" : "false"; }

} // namespace

TextService::TextService(Dictionary::DictionaryStore &store,
                         const Config::AppConfig &config)
    : store_(store), pattern_(config.dictionary.path),
      loader_options_(make_loader_options(config)),
      log_request_text_(config.logging.log_request_text),
      exists_requests_(MetricsRegistry::instance().create_counter(
          "textguard_requests_total", "Text service calls by method.",
          {{"method", "exists"}})),
      validate_requests_(MetricsRegistry::instance().create_counter(
          "textguard_requests_total", "Text service calls by method.",
          {{"method", "validate"}})),
      filter_requests_(MetricsRegistry::instance().create_counter(
          "textguard_requests_total", "Text service calls by method.",
          {{"method", "filter"}})),
      matched_requests_(MetricsRegistry::instance().create_counter(
          "textguard_matched_requests_total",
          "Calls whose text contained at least one dictionary word.")),
      reload_success_(MetricsRegistry::instance().create_counter(
          "textguard_dictionary_reloads_total", "Dictionary reloads by result.",
          {{"result", "success"}})),
      reload_failure_(MetricsRegistry::instance().create_counter(
          "textguard_dictionary_reloads_total", "Dictionary reloads by result.",
          {{"result", "failure"}})),
      dictionary_words_(MetricsRegistry::instance().create_gauge(
          "textguard_dictionary_words",
          "Number of words in the published dictionary.")),
      scan_duration_(MetricsRegistry::instance().create_histogram(
          "textguard_scan_duration_seconds",
          "Latency of a single exists or filter scan.",
          SCAN_DURATION_BUCKETS)) {
  dictionary_words_.Set(static_cast<double>(store_.current()->word_count));
}

bool TextService::timed_exists(std::string_view text,
                               const char *method) const {
  auto snapshot = store_.current();
  ScopedTimer timer(scan_duration_);
  bool found = Dictionary::exists(*snapshot, text);
  if (found)
    matched_requests_.Increment();

  if (log_request_text_)
    LOG(LogLevel::DEBUG, LogComponent::SERVICE,
        "method=" << method << " text=\"" << text << "\" found="
                  << bool_to_string(found) << " version=" << snapshot->version
                  << " took=" << timer.elapsed_seconds() * 1e6 << "us");
  else
    LOG(LogLevel::DEBUG, LogComponent::SERVICE,
        "method=" << method << " length=" << text.size()
                  << " found=" << bool_to_string(found)
                  << " version=" << snapshot->version
                  << " took=" << timer.elapsed_seconds() * 1e6 << "us");
  return found;
}

bool TextService::exists(std::string_view text) const {
  exists_requests_.Increment();
  return timed_exists(text, "exists");
}

bool TextService::validate(std::string_view text) const {
  validate_requests_.Increment();
  return !timed_exists(text, "validate");
}

std::string TextService::filter(std::string_view text) const {
  filter_requests_.Increment();
  auto snapshot = store_.current();
  ScopedTimer timer(scan_duration_);

  std::string filtered =
      Dictionary::filter(*snapshot, text, snapshot->mask_char);
  if (filtered != text)
    matched_requests_.Increment();

  if (log_request_text_)
    LOG(LogLevel::DEBUG, LogComponent::SERVICE,
        "method=filter text=\"" << text << "\" filtered=\"" << filtered
                                << "\" version=" << snapshot->version
                                << " took=" << timer.elapsed_seconds() * 1e6
                                << "us");
  else
    LOG(LogLevel::DEBUG, LogComponent::SERVICE,
        "method=filter length=" << text.size() << " changed="
                                << bool_to_string(filtered != text)
                                << " version=" << snapshot->version
                                << " took=" << timer.elapsed_seconds() * 1e6
                                << "us");
  return filtered;
}

size_t TextService::reload(const std::string &pattern) {
  Dictionary::LoaderOptions options;
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    options = loader_options_;
  }

  try {
    size_t word_count = store_.reload(pattern, options);
    reload_success_.Increment();
    dictionary_words_.Set(static_cast<double>(word_count));
    LOG(LogLevel::INFO, LogComponent::SERVICE,
        "Dictionary reloaded from '" << pattern << "' with " << word_count
                                     << " words");
    return word_count;
  } catch (const Dictionary::LoadError &) {
    reload_failure_.Increment();
    throw;
  }
}

size_t TextService::reload() { return reload(dictionary_pattern()); }

void TextService::reconfigure(const Config::AppConfig &config) {
  {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    pattern_ = config.dictionary.path;
    loader_options_ = make_loader_options(config);
  }
  log_request_text_ = config.logging.log_request_text;
  LOG(LogLevel::INFO, LogComponent::SERVICE,
      "Text service reconfigured, dictionary pattern '"
          << config.dictionary.path
          << "'; mask and loader options apply from the next reload");
}

std::shared_ptr<const Dictionary::DictionarySnapshot>
TextService::snapshot() const {
  return store_.current();
}

std::string TextService::dictionary_pattern() const {
  std::lock_guard<std::mutex> lock(settings_mutex_);
  return pattern_;
}
