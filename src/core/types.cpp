#include "core/types.hpp"

#include <type_traits>

namespace docsync {

static_assert(sizeof(Uuid) == Uuid::BYTE_SIZE, "Uuid must stay 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>);
static_assert(std::is_trivially_copyable_v<Timestamp>);

} // namespace docsync
