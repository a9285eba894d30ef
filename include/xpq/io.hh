#pragma once

#include <thrift/protocol/TCompactProtocol.h>
#include <thrift/transport/TBufferTransports.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace xpq {

using bytes_view = std::basic_string_view<uint8_t>;

// Decodes the thrift compact encoding of msg from the front of data and returns the
// number of bytes it took up. Throws TTransportException (END_OF_FILE) if data ends
// before the structure does.
template <typename T>
size_t decode_thrift(bytes_view data, T& msg) {
    using memory_transport = apache::thrift::transport::TMemoryBuffer;
    // TMemoryBuffer does not write to an OBSERVE buffer, the const_cast is safe.
    auto transport = std::make_shared<memory_transport>(
            const_cast<uint8_t*>(data.data()), static_cast<uint32_t>(data.size()));
    apache::thrift::protocol::TCompactProtocolT<memory_transport> protocol{transport};
    msg.read(&protocol);
    return data.size() - transport->available_read();
}

} // namespace xpq
