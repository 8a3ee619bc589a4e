#pragma once

namespace relpack::cli {

struct options;

int dispatch_main(const options&) noexcept;

}  // namespace relpack::cli
