#include <zkreceipt/receipt/segment_receipt.hpp>

namespace zkreceipt::receipt {

zkreceipt::schema::bytes_t segment_receipt_t::seal_bytes() const {
  return zkreceipt::schema::make_le_bytes(seal);
}

std::size_t segment_receipt_t::seal_size() const {
  return seal.size() * zkreceipt::schema::kWordSize;
}

}  // namespace zkreceipt::receipt
