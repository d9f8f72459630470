#include <page_turner/schedule_observer.hpp>
//

#include <page_turner/import/logging.hpp>

#include <batteries/assert.hpp>

namespace page_turner {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ std::shared_ptr<ScheduleObserver> NullScheduleObserver::instance()
{
  static const std::shared_ptr<ScheduleObserver> instance_ =
      std::make_shared<NullScheduleObserver>();

  return instance_;
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class LoggingScheduleObserver

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LoggingScheduleObserver::on_schedule(usize index) /*override*/
{
  VLOG(1) << "schedule " << BATT_INSPECT(index);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LoggingScheduleObserver::on_complete(usize index, const Status& status) /*override*/
{
  VLOG(1) << "complete " << BATT_INSPECT(index) << BATT_INSPECT(status);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LoggingScheduleObserver::on_discard(usize index, const Status& status) /*override*/
{
  VLOG(1) << "discard " << BATT_INSPECT(index) << BATT_INSPECT(status);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LoggingScheduleObserver::on_terminate(const Status& status) /*override*/
{
  VLOG(1) << "terminate " << BATT_INSPECT(status);
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// struct ScheduleMetrics

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void ScheduleMetrics::reset()
{
  this->scheduled_count.reset();
  this->completed_count.reset();
  this->failed_count.reset();
  this->discarded_count.reset();
  this->terminated_count.reset();
  this->terminated_with_error_count.reset();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const ScheduleMetrics& t)
{
  return out << "ScheduleMetrics{.scheduled=" << t.scheduled_count.load()  //
             << ", .completed=" << t.completed_count.load()                //
             << ", .failed=" << t.failed_count.load()                      //
             << ", .discarded=" << t.discarded_count.load()                //
             << ", .terminated=" << t.terminated_count.load()              //
             << ", .terminated_with_error=" << t.terminated_with_error_count.load()  //
             << ",}";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class MetricsScheduleObserver

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ MetricsScheduleObserver::MetricsScheduleObserver(ScheduleMetrics& metrics) noexcept
    : metrics_{metrics}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void MetricsScheduleObserver::on_schedule(usize) /*override*/
{
  this->metrics_.scheduled_count.add(1);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void MetricsScheduleObserver::on_complete(usize, const Status& status) /*override*/
{
  this->metrics_.completed_count.add(1);
  if (!status.ok()) {
    this->metrics_.failed_count.add(1);
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void MetricsScheduleObserver::on_discard(usize, const Status&) /*override*/
{
  this->metrics_.discarded_count.add(1);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void MetricsScheduleObserver::on_terminate(const Status& status) /*override*/
{
  this->metrics_.terminated_count.add(1);
  if (!status.ok()) {
    this->metrics_.terminated_with_error_count.add(1);
  }
}

}  // namespace page_turner
