#include <gogsync/sync/sync-engine.hxx>

namespace gogsync
{
  // Explicit template instantiations.
  //
  template class basic_sync_engine<sync_engine_traits<>>;
}
