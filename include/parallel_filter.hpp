#ifndef PYRAMID_PARALLEL_FILTER_HPP
#define PYRAMID_PARALLEL_FILTER_HPP

#include "logging/logger.hpp"

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/thread/thread.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <future>
#include <vector>

namespace pyramid { namespace util {

namespace detail {

// thrown by a worker which saw that another worker failed.
struct workers_stopped : public std::exception {
  virtual ~workers_stopped() {}
  const char *what() const noexcept {
    return "Worker stopped by exception thrown on a different thread";
  }
};

// each worker claims the next unclaimed position and writes the
// outcome into the slot for that position, and only that slot, so
// no locking is needed and the order of the output doesn't depend
// on which worker finishes first.
template <typename T, typename Predicate>
void filter_worker(const std::vector<T> &items,
                   Predicate keep,
                   std::vector<boost::optional<T> > &results,
                   std::atomic<size_t> &next,
                   std::atomic<bool> &stop_all_threads) {
  try {
    const size_t n = items.size();
    for (size_t i = next++; i < n; i = next++) {
      if (stop_all_threads.load()) {
        throw workers_stopped();
      }

      if (keep(items[i])) {
        results[i] = items[i];
      }
    }

  } catch (...) {
    stop_all_threads.store(true);
    throw;
  }
}

} // namespace detail

/* returns the items for which `keep` returns true, in their
 * original order, testing them on a pool of worker threads.
 *
 * `keep` is called concurrently, so it must be safe to do so. zero
 * threads means use the hardware concurrency of the host, and there
 * are never more threads than items.
 *
 * if `keep` throws, the other workers stop early, all threads are
 * joined and then the first exception is re-thrown.
 */
template <typename T, typename Predicate>
std::vector<T> parallel_filter(const std::vector<T> &items, Predicate keep,
                               unsigned int threads) {
  unsigned int num_threads = threads;
  if (num_threads == 0) {
    num_threads = std::max(boost::thread::hardware_concurrency(), 1u);
  }
  if (items.size() < num_threads) {
    num_threads = std::max<unsigned int>(items.size(), 1u);
  }

  std::vector<boost::optional<T> > results(items.size());
  std::atomic<size_t> next(0);
  std::atomic<bool> stop(false);

  std::vector<std::future<void> > workers;
  for (unsigned int i = 0; i < num_threads; ++i) {
    workers.emplace_back(std::async(std::launch::async, &detail::filter_worker<T, Predicate>,
                                    std::cref(items), keep,
                                    std::ref(results), std::ref(next),
                                    std::ref(stop)));
  }

  // gather the exceptions from all the workers, but don't stop
  // gathering - all the threads must be joined before `results`
  // goes out of scope.
  std::exception_ptr error;
  for (auto &fut : workers) {
    try {
      fut.get();

    } catch (const detail::workers_stopped &) {
      // the first error is reported by the worker which threw it.

    } catch (const std::exception &e) {
      LOG_ERROR(boost::format("Worker thread failed: %1%") % e.what());
      if (!error) {
        error = std::current_exception();
      }

    } catch (...) {
      LOG_ERROR(std::string("Worker thread failed with an unknown error"));
      if (!error) {
        error = std::current_exception();
      }
    }
  }

  if (error) {
    std::rethrow_exception(error);
  }

  std::vector<T> kept;
  for (const auto &r : results) {
    if (r) {
      kept.push_back(*r);
    }
  }
  return kept;
}

} } // namespace pyramid::util

#endif // PYRAMID_PARALLEL_FILTER_HPP
