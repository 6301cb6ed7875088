#ifndef PEERSHARE_TRANSFER_FORMAT_H
#define PEERSHARE_TRANSFER_FORMAT_H

#include <cstdint>
#include <string>

namespace peershare {

// "0 B", "512 B", "1.5 KB", "64 KB", ... up to TB
std::string format_bytes(uint64_t bytes);
std::string format_speed(double bytes_per_second);
// "--:--" when unknown, otherwise "42s", "3m 5s" or "2h 10m"
std::string format_eta(double seconds);

} // namespace peershare

#endif // PEERSHARE_TRANSFER_FORMAT_H
