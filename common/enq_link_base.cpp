#include "enq_link_base.hpp"

namespace elevator_link {

const char *LinkErrorName(LinkError error) noexcept {
  switch (error) {
    case LinkError::Ok:
      return "ok";
    case LinkError::OpenFailed:
      return "open failed";
    case LinkError::ConfigFailed:
      return "config failed";
    case LinkError::WriteFailure:
      return "write failure";
    case LinkError::ReadFailure:
      return "read failure";
    case LinkError::EncodeFailure:
      return "encode failure";
  }
  return "unknown";
}

LinkError EnqLinkBase::SendFrame(const enq::EnqFrame &frame) {
  last_tx_size_ = 0;
  auto result = enq::Protocol::BuildFrame(tx_frame_, frame);

  if (enq::IsError(result)) {
    return LinkError::EncodeFailure;
  }

  size_t len = enq::GetValue(result);
  if (Write(std::span<const uint8_t>(tx_frame_.data(), len)) != 0) {
    return LinkError::WriteFailure;
  }
  last_tx_size_ = len;
  return LinkError::Ok;
}

}  // namespace elevator_link
