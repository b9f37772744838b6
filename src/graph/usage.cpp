#include <vkfg/graph/usage.hpp>

namespace vkfg::graph {

VkPipelineStageFlags2 stageFlags(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::Vertex:
        return VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT;
    case ShaderStage::Fragment:
        return VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
    case ShaderStage::Graphics:
        return VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT | VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
    case ShaderStage::Compute:
        return VK_PIPELINE_STAGE_2_COMPUTE_SHADER_BIT;
    case ShaderStage::RayTracing:
        return VK_PIPELINE_STAGE_2_RAY_TRACING_SHADER_BIT_KHR;
    }
    return VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
}

namespace usage {

BufferUsage uniformRead(ShaderStage stage) {
    return {stageFlags(stage), VK_ACCESS_2_UNIFORM_READ_BIT,
            VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT};
}

BufferUsage storageRead(ShaderStage stage) {
    return {stageFlags(stage), VK_ACCESS_2_SHADER_STORAGE_READ_BIT,
            VK_BUFFER_USAGE_STORAGE_BUFFER_BIT};
}

BufferUsage storageWrite(ShaderStage stage) {
    return {stageFlags(stage), VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
            VK_BUFFER_USAGE_STORAGE_BUFFER_BIT};
}

BufferUsage storageReadWrite(ShaderStage stage) {
    return {stageFlags(stage),
            VK_ACCESS_2_SHADER_STORAGE_READ_BIT | VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT,
            VK_BUFFER_USAGE_STORAGE_BUFFER_BIT};
}

BufferUsage vertexRead() {
    return {VK_PIPELINE_STAGE_2_VERTEX_INPUT_BIT, VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT,
            VK_BUFFER_USAGE_VERTEX_BUFFER_BIT};
}

BufferUsage indexRead() {
    return {VK_PIPELINE_STAGE_2_INDEX_INPUT_BIT, VK_ACCESS_2_INDEX_READ_BIT,
            VK_BUFFER_USAGE_INDEX_BUFFER_BIT};
}

BufferUsage indirectRead() {
    return {VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT, VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT,
            VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT};
}

BufferUsage transferSrc() {
    return {VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_READ_BIT,
            VK_BUFFER_USAGE_TRANSFER_SRC_BIT};
}

BufferUsage transferDst() {
    return {VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT, VK_ACCESS_2_TRANSFER_WRITE_BIT,
            VK_BUFFER_USAGE_TRANSFER_DST_BIT};
}

BufferUsage accelerationStructureInput() {
    return {VK_PIPELINE_STAGE_2_ACCELERATION_STRUCTURE_BUILD_BIT_KHR,
            VK_ACCESS_2_SHADER_READ_BIT,
            VK_BUFFER_USAGE_ACCELERATION_STRUCTURE_BUILD_INPUT_READ_ONLY_BIT_KHR |
                VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT};
}

BufferUsage accelerationStructureStorage() {
    return {VK_PIPELINE_STAGE_2_ACCELERATION_STRUCTURE_BUILD_BIT_KHR,
            VK_ACCESS_2_ACCELERATION_STRUCTURE_READ_BIT_KHR |
                VK_ACCESS_2_ACCELERATION_STRUCTURE_WRITE_BIT_KHR,
            VK_BUFFER_USAGE_ACCELERATION_STRUCTURE_STORAGE_BIT_KHR |
                VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT};
}

ImageUsage sampled(ShaderStage stage) {
    ImageUsage u;
    u.stages = stageFlags(stage);
    u.access = VK_ACCESS_2_SHADER_SAMPLED_READ_BIT;
    u.layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    u.usage  = VK_IMAGE_USAGE_SAMPLED_BIT;
    return u;
}

ImageUsage storageImageRead(ShaderStage stage) {
    ImageUsage u;
    u.stages = stageFlags(stage);
    u.access = VK_ACCESS_2_SHADER_STORAGE_READ_BIT;
    u.layout = VK_IMAGE_LAYOUT_GENERAL;
    u.usage  = VK_IMAGE_USAGE_STORAGE_BIT;
    return u;
}

ImageUsage storageImageWrite(ShaderStage stage) {
    ImageUsage u;
    u.stages = stageFlags(stage);
    u.access = VK_ACCESS_2_SHADER_STORAGE_WRITE_BIT;
    u.layout = VK_IMAGE_LAYOUT_GENERAL;
    u.usage  = VK_IMAGE_USAGE_STORAGE_BIT;
    return u;
}

ImageUsage storageImageReadWrite(ShaderStage stage) {
    ImageUsage u = storageImageWrite(stage);
    u.access |= VK_ACCESS_2_SHADER_STORAGE_READ_BIT;
    return u;
}

ImageUsage colorAttachmentWrite() {
    ImageUsage u;
    u.stages = VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT;
    u.access = VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT;
    u.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    u.usage  = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    return u;
}

ImageUsage colorAttachmentReadWrite() {
    ImageUsage u = colorAttachmentWrite();
    u.access |= VK_ACCESS_2_COLOR_ATTACHMENT_READ_BIT;
    return u;
}

ImageUsage depthAttachmentWrite() {
    ImageUsage u;
    u.stages = VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT |
               VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT;
    u.access = VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT |
               VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT;
    u.layout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL;
    u.usage  = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    return u;
}

ImageUsage depthAttachmentRead() {
    ImageUsage u;
    u.stages = VK_PIPELINE_STAGE_2_EARLY_FRAGMENT_TESTS_BIT |
               VK_PIPELINE_STAGE_2_LATE_FRAGMENT_TESTS_BIT;
    u.access = VK_ACCESS_2_DEPTH_STENCIL_ATTACHMENT_READ_BIT;
    u.layout = VK_IMAGE_LAYOUT_DEPTH_STENCIL_READ_ONLY_OPTIMAL;
    u.usage  = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    return u;
}

ImageUsage inputAttachment() {
    ImageUsage u;
    u.stages = VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
    u.access = VK_ACCESS_2_INPUT_ATTACHMENT_READ_BIT;
    u.layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
    u.usage  = VK_IMAGE_USAGE_INPUT_ATTACHMENT_BIT;
    return u;
}

ImageUsage transferSrcImage() {
    ImageUsage u;
    u.stages = VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT;
    u.access = VK_ACCESS_2_TRANSFER_READ_BIT;
    u.layout = VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL;
    u.usage  = VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    return u;
}

ImageUsage transferDstImage() {
    ImageUsage u;
    u.stages = VK_PIPELINE_STAGE_2_ALL_TRANSFER_BIT;
    u.access = VK_ACCESS_2_TRANSFER_WRITE_BIT;
    u.layout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
    u.usage  = VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    return u;
}

} // namespace usage

} // namespace vkfg::graph
