#include "dictionary_store.hpp"
#include "core/logger.hpp"

#include <atomic>
#include <stdexcept>
#include <utility>

namespace Dictionary {

DictionaryStore::DictionaryStore() {
  auto empty = make_empty_snapshot();
  empty->version = 0;
  std::atomic_store(&current_,
                    std::shared_ptr<const DictionarySnapshot>(std::move(empty)));
}

std::shared_ptr<const DictionarySnapshot> DictionaryStore::current() const {
  return std::atomic_load(&current_);
}

uint64_t DictionaryStore::publish(std::shared_ptr<DictionarySnapshot> snapshot) {
  if (!snapshot)
    throw std::invalid_argument("DictionaryStore: cannot publish a null snapshot");
  std::lock_guard<std::mutex> lock(writer_mutex_);
  return publish_locked(std::move(snapshot));
}

uint64_t
DictionaryStore::publish_locked(std::shared_ptr<DictionarySnapshot> snapshot) {
  if (!snapshot->automaton)
    snapshot->automaton = std::make_shared<const Utils::AhoCorasick>();

  uint64_t version = next_version_++;
  snapshot->version = version;
  std::atomic_store(&current_,
                    std::shared_ptr<const DictionarySnapshot>(std::move(snapshot)));

  LOG(LogLevel::INFO, LogComponent::DICT_STORE,
      "Published dictionary version " << version);
  return version;
}

size_t DictionaryStore::reload(const std::string &pattern,
                               const LoaderOptions &options) {
  std::lock_guard<std::mutex> lock(writer_mutex_);

  DictionaryLoader loader(options);
  std::shared_ptr<DictionarySnapshot> snapshot;
  try {
    snapshot = loader.load(pattern);
  } catch (const LoadError &e) {
    LOG(LogLevel::ERROR, LogComponent::DICT_STORE,
        "Dictionary reload failed, keeping version "
            << current()->version << ": " << e.what());
    throw;
  }

  size_t word_count = snapshot->word_count;
  publish_locked(std::move(snapshot));
  return word_count;
}

} // namespace Dictionary
