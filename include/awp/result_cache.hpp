/**
 * @file result_cache.hpp
 * @brief Contract of the external analysis result cache.
 *
 * The pool reads it before admitting a synchronous job that carries a cache
 * key, and writes successful results under that key. It never performs
 * read-modify-write, so no cross-job coordination is needed. Implementations
 * must be safe to call from several pool threads at once.
 */

#ifndef AWP_RESULT_CACHE_HPP_
#define AWP_RESULT_CACHE_HPP_

#include "awp/vocabulary.hpp"

#include <cstdint>

namespace awp {

template <typename ResultT>
class ResultCache {
 public:
  virtual ~ResultCache() = default;

  /** @return The cached value, or empty on a miss. */
  virtual optional<ResultT> Get(const char* ns, const char* key) = 0;

  /**
   * @param ttl_ms 0 lets the cache apply its own default.
   * @return false if the value could not be stored.
   */
  virtual bool Put(const char* ns, const char* key, const ResultT& value, uint32_t ttl_ms) = 0;
};

}  // namespace awp

#endif  // AWP_RESULT_CACHE_HPP_
