#pragma once
#include <optional>
#include <string>
#include <vector>

namespace nla::decode {

// Hardware decode back-ends we know how to probe.
enum class HwDeviceKind { Vaapi, Cuda, Vdpau, VideoToolbox, D3D11VA, DXVA2 };

const char* hw_device_name(HwDeviceKind kind);
std::optional<HwDeviceKind> hw_device_from_name(const std::string& name);

// Probe order for the platform this binary was built for. Earlier entries win.
std::vector<HwDeviceKind> platform_hw_candidates();

} // namespace nla::decode
