#include <vkfg/graph/persistent.hpp>

#include <vkfg/error.hpp>

namespace vkfg::graph {

// ---------------------------------------------------------------------------
// PersistentBuffer
// ---------------------------------------------------------------------------

Result<PersistentBuffer> PersistentBuffer::create(const ResourceContext& ctx,
                                                  const BufferCreateDesc& desc) {
    auto first = PhysicalBuffer::create(ctx, desc);
    if (!first.ok()) return first.error();

    auto second = PhysicalBuffer::create(ctx, desc);
    if (!second.ok()) {
        first.value().destroy(ctx);
        return second.error();
    }

    PersistentBuffer p;
    p.buffers_ = {first.value(), second.value()};
    p.desc_    = desc;
    p.live_    = true;
    return p;
}

PersistentBuffer::PersistentBuffer(PersistentBuffer&& o) noexcept
    : buffers_(o.buffers_), access_(o.access_), desc_(o.desc_), current_(o.current_),
      live_(o.live_) {
    o.live_ = false;
}

PersistentBuffer& PersistentBuffer::operator=(PersistentBuffer&& o) noexcept {
    if (this != &o) {
        if (live_) {
            fatal(Error{"move persistent buffer", 0,
                        "target still live; destroy() or retire() it first"});
        }
        buffers_ = o.buffers_;
        access_  = o.access_;
        desc_    = o.desc_;
        current_ = o.current_;
        live_    = o.live_;
        o.live_  = false;
    }
    return *this;
}

std::pair<BufferRes, BufferRes> PersistentBuffer::next(PassBuilder& pass, const BufferUsage& read,
                                                       const BufferUsage& write) {
    if (!live_) fatal(Error{"import persistent buffer", 0, "buffer pair was destroyed"});
    std::uint32_t next = current_ ^ 1u;

    ExternalBuffer previous;
    previous.handle  = buffers_[current_].handle();
    previous.initial = access_[current_];
    ExternalBuffer target;
    target.handle  = buffers_[next].handle();
    target.initial = access_[next];

    BufferRes readRes  = pass.import(previous, read);
    BufferRes writeRes = pass.import(target, write);

    access_[current_] = read.info();
    access_[next]     = write.info();
    current_          = next;
    return {readRes, writeRes};
}

void PersistentBuffer::retire(Deleter& deleter) {
    if (!live_) return;
    deleter.push(buffers_[0]);
    deleter.push(buffers_[1]);
    live_ = false;
}

void PersistentBuffer::destroy(const ResourceContext& ctx) {
    if (!live_) return;
    buffers_[0].destroy(ctx);
    buffers_[1].destroy(ctx);
    live_ = false;
}

// ---------------------------------------------------------------------------
// PersistentImage
// ---------------------------------------------------------------------------

Result<PersistentImage> PersistentImage::create(const ResourceContext& ctx,
                                                const ImageCreateDesc& desc,
                                                VkImageLayout layout) {
    if (layout == VK_IMAGE_LAYOUT_UNDEFINED || layout == VK_IMAGE_LAYOUT_PREINITIALIZED) {
        return Error{"create persistent image", 0,
                     "end-of-frame layout must be a real layout, not UNDEFINED or PREINITIALIZED"};
    }

    auto first = PhysicalImage::create(ctx, desc);
    if (!first.ok()) return first.error();

    auto second = PhysicalImage::create(ctx, desc);
    if (!second.ok()) {
        first.value().destroy(ctx);
        return second.error();
    }

    PersistentImage p;
    p.images_      = {first.value(), second.value()};
    p.desc_        = desc;
    p.finalLayout_ = layout;
    p.live_        = true;
    return p;
}

PersistentImage::PersistentImage(PersistentImage&& o) noexcept
    : images_(o.images_), layouts_(o.layouts_), desc_(o.desc_), finalLayout_(o.finalLayout_),
      current_(o.current_), live_(o.live_) {
    o.live_ = false;
}

PersistentImage& PersistentImage::operator=(PersistentImage&& o) noexcept {
    if (this != &o) {
        if (live_) {
            fatal(Error{"move persistent image", 0,
                        "target still live; destroy() or retire() it first"});
        }
        images_      = o.images_;
        layouts_     = o.layouts_;
        desc_        = o.desc_;
        finalLayout_ = o.finalLayout_;
        current_     = o.current_;
        live_        = o.live_;
        o.live_      = false;
    }
    return *this;
}

ExternalImage PersistentImage::external(std::uint32_t index) const {
    ExternalImage e;
    e.handle         = images_[index].handle();
    e.desc           = desc_.desc;
    e.initial.layout = layouts_[index];
    e.final.layout   = finalLayout_;
    return e;
}

std::pair<ImageRes, ImageRes> PersistentImage::next(PassBuilder& pass, const ImageUsage& read,
                                                     const ImageUsage& write) {
    if (!live_) fatal(Error{"import persistent image", 0, "image pair was destroyed"});
    std::uint32_t next = current_ ^ 1u;

    ImageRes readRes  = pass.import(external(current_), read);
    ImageRes writeRes = pass.import(external(next), write);

    // Both are imported with final = finalLayout_, so the frame leaves them there.
    layouts_[current_] = finalLayout_;
    layouts_[next]     = finalLayout_;
    current_           = next;
    return {readRes, writeRes};
}

void PersistentImage::retire(Deleter& deleter) {
    if (!live_) return;
    deleter.push(images_[0]);
    deleter.push(images_[1]);
    live_ = false;
}

void PersistentImage::destroy(const ResourceContext& ctx) {
    if (!live_) return;
    images_[0].destroy(ctx);
    images_[1].destroy(ctx);
    live_ = false;
}

} // namespace vkfg::graph
