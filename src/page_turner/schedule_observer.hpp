#pragma once

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/metrics.hpp>
#include <page_turner/import/status.hpp>

#include <memory>
#include <ostream>

namespace page_turner {

/** \brief Receives scheduling events from look-ahead streams.
 *
 * Indices are the 0-based positions of requests in the stream's request sequence.  Callbacks are
 * invoked on the thread (or task) that calls the stream's `next()`, never from a fetch task, but
 * one observer may be shared by many streams, so implementations must be thread-safe.
 */
class ScheduleObserver
{
 public:
  ScheduleObserver(const ScheduleObserver&) = delete;
  ScheduleObserver& operator=(const ScheduleObserver&) = delete;

  virtual ~ScheduleObserver() = default;

  /** \brief A fetch for the request at `index` was submitted.
   */
  virtual void on_schedule(usize index) = 0;

  /** \brief The fetch for `index` finished and its result was taken by the stream.
   */
  virtual void on_complete(usize index, const Status& status) = 0;

  /** \brief The error for `index` will never be surfaced: either a lower-indexed error was already
   * retained, or the index lies past the last page.
   */
  virtual void on_discard(usize index, const Status& status) = 0;

  /** \brief The stream stopped scheduling; `status` is OkStatus() on normal end of data, otherwise
   * the terminal error.
   */
  virtual void on_terminate(const Status& status) = 0;

 protected:
  ScheduleObserver() = default;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
class NullScheduleObserver : public ScheduleObserver
{
 public:
  /** \brief Returns a process-wide shared instance.
   */
  static std::shared_ptr<ScheduleObserver> instance();

  NullScheduleObserver() = default;

  void on_schedule(usize) override
  {
  }

  void on_complete(usize, const Status&) override
  {
  }

  void on_discard(usize, const Status&) override
  {
  }

  void on_terminate(const Status&) override
  {
  }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief Writes every event to the glog VLOG(1) stream.
 */
class LoggingScheduleObserver : public ScheduleObserver
{
 public:
  LoggingScheduleObserver() = default;

  void on_schedule(usize index) override;

  void on_complete(usize index, const Status& status) override;

  void on_discard(usize index, const Status& status) override;

  void on_terminate(const Status& status) override;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
struct ScheduleMetrics {
  CountMetric<u64> scheduled_count{0};
  CountMetric<u64> completed_count{0};
  CountMetric<u64> failed_count{0};
  CountMetric<u64> discarded_count{0};
  CountMetric<u64> terminated_count{0};
  CountMetric<u64> terminated_with_error_count{0};

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Fetches that were submitted but whose result has not (yet) been taken.
   *
   * Fetches abandoned when a stream terminates early are never completed, so they remain counted
   * here for good.
   */
  u64 outstanding_count() const
  {
    return this->scheduled_count.load() - this->completed_count.load();
  }

  void reset();
};

std::ostream& operator<<(std::ostream& out, const ScheduleMetrics& t);

//----- --- -- -  -  -   -

/** \brief Counts events into a ScheduleMetrics object, which must outlive the observer.
 */
class MetricsScheduleObserver : public ScheduleObserver
{
 public:
  explicit MetricsScheduleObserver(ScheduleMetrics& metrics) noexcept;

  ScheduleMetrics& metrics() const noexcept
  {
    return this->metrics_;
  }

  void on_schedule(usize index) override;

  void on_complete(usize index, const Status& status) override;

  void on_discard(usize index, const Status& status) override;

  void on_terminate(const Status& status) override;

 private:
  ScheduleMetrics& metrics_;
};

}  // namespace page_turner
