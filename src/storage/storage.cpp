#include <conduit/storage/storage.hpp>

namespace conduit::storage {

void kv_store::apply(const std::vector<write_operation>& operations) {
  for (const auto& operation : operations) {
    if (operation.value) {
      put(operation.key, *operation.value);
    } else {
      remove(operation.key);
    }
  }
}

}  // namespace conduit::storage
