#include <page_turner/status.hpp>
//

#include <batteries/assert.hpp>

namespace page_turner {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static const bool initialized = [] {
    return batt::Status::register_codes<StatusCode>({
        {StatusCode::kOk, "Ok"},
        {StatusCode::kFetchException, "The page fetcher threw an exception"},
        {StatusCode::kFetchAbandoned,
         "The fetch was abandoned because its stream was halted before the fetch started"},
    });
  }();

  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status make_status(StatusCode code)
{
  BATT_CHECK(initialize_status_codes());

  return Status{code};
}

}  // namespace page_turner
