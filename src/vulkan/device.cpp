#include <vkfg/device.hpp>

#include <cinttypes>
#include <cstdio>
#include <string>
#include <vector>

namespace vkfg {

const char* queueTypeName(QueueType q) {
    switch (q) {
    case QueueType::Graphics: return "graphics";
    case QueueType::Compute:  return "compute";
    case QueueType::Transfer: return "transfer";
    }
    return "unknown";
}

QueueTopology QueueTopology::distinct() {
    QueueTopology t;
    t.family = {0, 1, 2};
    return t;
}

QueueTopology QueueTopology::single() {
    QueueTopology t;
    t.stream = {QueueType::Graphics, QueueType::Graphics, QueueType::Graphics};
    t.family = {0, 0, 0};
    return t;
}

Result<Device> Device::adopt(const DeviceHandles& h) {
    if (h.device == VK_NULL_HANDLE || h.physicalDevice == VK_NULL_HANDLE) {
        return Error{"adopt device", 0, "device and physical device handles are required"};
    }
    if (h.graphicsQueue == VK_NULL_HANDLE || h.families.graphics == UINT32_MAX) {
        return Error{"adopt device", 0, "a graphics queue and its family are required"};
    }

    Device d;
    d.instance_       = h.instance;
    d.physicalDevice_ = h.physicalDevice;
    d.device_         = h.device;
    d.families_       = h.families;

    auto G = queueIndex(QueueType::Graphics);
    auto C = queueIndex(QueueType::Compute);
    auto T = queueIndex(QueueType::Transfer);

    d.queues_[G]          = h.graphicsQueue;
    d.topology_.family[G] = h.families.graphics;

    // Compute: own stream only when it is a different VkQueue.
    if (h.computeQueue != VK_NULL_HANDLE && h.computeQueue != h.graphicsQueue &&
        h.families.compute != UINT32_MAX) {
        d.queues_[C]          = h.computeQueue;
        d.topology_.stream[C] = QueueType::Compute;
        d.topology_.family[C] = h.families.compute;
    } else {
        d.queues_[C]          = h.graphicsQueue;
        d.topology_.stream[C] = QueueType::Graphics;
        d.topology_.family[C] = h.families.graphics;
    }

    // Transfer: falls back to the compute stream, then graphics.
    if (h.transferQueue != VK_NULL_HANDLE && h.transferQueue != h.graphicsQueue &&
        h.transferQueue != d.queues_[C] && h.families.transfer != UINT32_MAX) {
        d.queues_[T]          = h.transferQueue;
        d.topology_.stream[T] = QueueType::Transfer;
        d.topology_.family[T] = h.families.transfer;
    } else if (h.transferQueue != VK_NULL_HANDLE && h.transferQueue == d.queues_[C] &&
               d.topology_.stream[C] == QueueType::Compute) {
        d.queues_[T]          = d.queues_[C];
        d.topology_.stream[T] = QueueType::Compute;
        d.topology_.family[T] = d.topology_.family[C];
    } else {
        d.queues_[T]          = h.graphicsQueue;
        d.topology_.stream[T] = QueueType::Graphics;
        d.topology_.family[T] = h.families.graphics;
    }

    for (std::uint32_t i = 0; i < kQueueTypeCount; ++i) {
        std::uint32_t f = d.topology_.family[i];
        bool seen = false;
        for (std::uint32_t j = 0; j < d.distinctCount_; ++j) {
            if (d.distinct_[j] == f) seen = true;
        }
        if (!seen) d.distinct_[d.distinctCount_++] = f;
    }

    if (h.debugUtils && h.instance != VK_NULL_HANDLE) {
        d.pfnSetName_ = reinterpret_cast<PFN_vkSetDebugUtilsObjectNameEXT>(
            vkGetInstanceProcAddr(h.instance, "vkSetDebugUtilsObjectNameEXT"));
        d.pfnBeginLabel_ = reinterpret_cast<PFN_vkCmdBeginDebugUtilsLabelEXT>(
            vkGetInstanceProcAddr(h.instance, "vkCmdBeginDebugUtilsLabelEXT"));
        d.pfnEndLabel_ = reinterpret_cast<PFN_vkCmdEndDebugUtilsLabelEXT>(
            vkGetInstanceProcAddr(h.instance, "vkCmdEndDebugUtilsLabelEXT"));
#ifndef NDEBUG
        if (!d.pfnSetName_ || !d.pfnBeginLabel_ || !d.pfnEndLabel_) {
            std::fprintf(stderr, "[vkfg] debug utils requested but entry points "
                                 "are missing; labels disabled\n");
        }
#endif
        if (!d.pfnBeginLabel_ || !d.pfnEndLabel_) {
            d.pfnBeginLabel_ = nullptr;
            d.pfnEndLabel_   = nullptr;
        }
    }

    // Both optional; null when the extensions were not enabled.
    d.pfnDestroyAS_ = reinterpret_cast<PFN_vkDestroyAccelerationStructureKHR>(
        vkGetDeviceProcAddr(h.device, "vkDestroyAccelerationStructureKHR"));
    d.pfnFault_ = reinterpret_cast<PFN_vkGetDeviceFaultInfoEXT>(
        vkGetDeviceProcAddr(h.device, "vkGetDeviceFaultInfoEXT"));

    return d;
}

void Device::reportDeviceLost() const {
    std::fprintf(stderr, "vkfg: device lost\n");
    std::string fault = queryDeviceFault();
    if (!fault.empty()) std::fprintf(stderr, "%s\n", fault.c_str());
    if (lostCallback_) lostCallback_();
}

std::string Device::queryDeviceFault() const {
    if (!pfnFault_ || device_ == VK_NULL_HANDLE) return {};

    VkDeviceFaultCountsEXT counts{};
    counts.sType = VK_STRUCTURE_TYPE_DEVICE_FAULT_COUNTS_EXT;
    VkResult vr = pfnFault_(device_, &counts, nullptr);
    if (vr != VK_SUCCESS && vr != VK_INCOMPLETE) return {};

    std::vector<VkDeviceFaultAddressInfoEXT> addressInfos(counts.addressInfoCount);
    std::vector<VkDeviceFaultVendorInfoEXT>  vendorInfos(counts.vendorInfoCount);

    VkDeviceFaultInfoEXT info{};
    info.sType         = VK_STRUCTURE_TYPE_DEVICE_FAULT_INFO_EXT;
    info.pAddressInfos = addressInfos.empty() ? nullptr : addressInfos.data();
    info.pVendorInfos  = vendorInfos.empty() ? nullptr : vendorInfos.data();

    vr = pfnFault_(device_, &counts, &info);
    if (vr != VK_SUCCESS && vr != VK_INCOMPLETE) return {};

    std::string out = "device fault: ";
    out += info.description;
    for (std::uint32_t i = 0; i < counts.addressInfoCount; ++i) {
        char line[96];
        std::snprintf(line, sizeof(line), "\n  address [%u]: type=%d addr=0x%" PRIx64, i,
                      static_cast<int>(addressInfos[i].addressType),
                      static_cast<std::uint64_t>(addressInfos[i].reportedAddress));
        out += line;
    }
    for (std::uint32_t i = 0; i < counts.vendorInfoCount; ++i) {
        out += "\n  vendor [" + std::to_string(i) + "]: " +
               std::string(vendorInfos[i].description);
    }
    return out;
}

Result<void> Device::waitIdle() const {
    if (device_ == VK_NULL_HANDLE) return {};

    // VKFG_BLOCKING_WAIT: full device idle.
    VkResult vr = vkDeviceWaitIdle(device_);
    if (vr != VK_SUCCESS) {
        if (vr == VK_ERROR_DEVICE_LOST) reportDeviceLost();
        return Error{"wait for device idle", static_cast<std::int32_t>(vr),
                     "vkDeviceWaitIdle failed"};
    }
    return {};
}

} // namespace vkfg
