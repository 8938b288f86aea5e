#ifndef DICTIONARY_STORE_HPP
#define DICTIONARY_STORE_HPP

#include "dictionary_loader.hpp"
#include "dictionary_snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace Dictionary {

// Holds the dictionary currently in effect. Readers take the snapshot with a
// lock-free atomic load and keep using it for the whole call; writers are
// serialized and replace the pointer as a whole.
class DictionaryStore {
public:
  DictionaryStore();

  DictionaryStore(const DictionaryStore &) = delete;
  DictionaryStore &operator=(const DictionaryStore &) = delete;

  // Never null. Starts out as an empty dictionary.
  std::shared_ptr<const DictionarySnapshot> current() const;

  // Stamps the snapshot with the next version and makes it current.
  uint64_t publish(std::shared_ptr<DictionarySnapshot> snapshot);

  // Builds a dictionary from the files matching `pattern` and publishes it.
  // Returns the new word count. On LoadError the previous snapshot stays.
  size_t reload(const std::string &pattern, const LoaderOptions &options);

private:
  uint64_t publish_locked(std::shared_ptr<DictionarySnapshot> snapshot);

  std::shared_ptr<const DictionarySnapshot> current_;
  uint64_t next_version_ = 1;
  std::mutex writer_mutex_;
};

} // namespace Dictionary

#endif // DICTIONARY_STORE_HPP
