#include <zkreceipt/receipt/receipt.hpp>

namespace zkreceipt::receipt {

zkreceipt::schema::maybe_pruned<zkreceipt::schema::receipt_claim_t>
receipt_t::claim() const {
  return inner.claim();
}

}  // namespace zkreceipt::receipt
