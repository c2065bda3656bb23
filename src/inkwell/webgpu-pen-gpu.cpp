#include <inkwell/webgpu-pen-gpu.h>
#include <inkwell/line-batch.h>
#include <inkwell/wgpu-compat.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstring>
#include <optional>
#include <string>
#include <unordered_map>

namespace inkwell {

namespace {

constexpr WGPUTextureFormat PEN_TEXTURE_FORMAT = WGPUTextureFormat_RGBA8Unorm;

// Texture-to-buffer copies need 256-byte aligned rows
inline uint32_t alignedBytesPerRow(uint32_t width) {
    return (width * 4 + 255) & ~255u;
}

} // namespace

class WebGPUPenGpuImpl : public WebGPUPenGpu {
public:
    WebGPUPenGpuImpl(const GPUContext& gpu, ShaderCache::Ptr shaders)
        : _gpu(gpu)
        , _shaders(std::move(shaders)) {}

    ~WebGPUPenGpuImpl() override {
        dispose();
    }

    Result<void> init() {
        if (!_gpu.device || !_gpu.queue) {
            return Err<void>("WebGPUPenGpu: null device or queue");
        }
        if (!_shaders) {
            return Err<void>("WebGPUPenGpu: null shader cache");
        }

        WGPUSamplerDescriptor samplerDesc = {};
        samplerDesc.label = WGPU_STR("pen sampler");
        samplerDesc.magFilter = WGPUFilterMode_Nearest;
        samplerDesc.minFilter = WGPUFilterMode_Nearest;
        samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
        samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
        samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
        samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
        samplerDesc.maxAnisotropy = 1;
        _sampler = wgpuDeviceCreateSampler(_gpu.device, &samplerDesc);
        if (!_sampler) {
            return Err<void>("WebGPUPenGpu: failed to create sampler");
        }

        WGPUBufferDescriptor bufDesc = {};
        bufDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;

        bufDesc.label = WGPU_STR("pen quad uniforms");
        bufDesc.size = sizeof(QuadUniforms);
        _quadUniformBuffer = wgpuDeviceCreateBuffer(_gpu.device, &bufDesc);
        if (!_quadUniformBuffer) {
            return Err<void>("WebGPUPenGpu: failed to create quad uniform buffer");
        }

        bufDesc.label = WGPU_STR("pen line uniforms");
        bufDesc.size = sizeof(LineUniforms);
        _lineUniformBuffer = wgpuDeviceCreateBuffer(_gpu.device, &bufDesc);
        if (!_lineUniformBuffer) {
            return Err<void>("WebGPUPenGpu: failed to create line uniform buffer");
        }

        spdlog::info("WebGPUPenGpu: initialized");
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Textures
    //-------------------------------------------------------------------------

    Result<TextureHandle> createTexture(uint32_t width, uint32_t height) override {
        if (width == 0 || height == 0) {
            return Err<TextureHandle>("WebGPUPenGpu::createTexture: zero size");
        }

        WGPUTextureDescriptor texDesc = {};
        texDesc.label = WGPU_STR("pen surface");
        texDesc.size = {width, height, 1};
        texDesc.format = PEN_TEXTURE_FORMAT;
        texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_RenderAttachment |
                        WGPUTextureUsage_CopyDst | WGPUTextureUsage_CopySrc;
        texDesc.mipLevelCount = 1;
        texDesc.sampleCount = 1;
        texDesc.dimension = WGPUTextureDimension_2D;

        WGPUTexture texture = wgpuDeviceCreateTexture(_gpu.device, &texDesc);
        if (!texture) {
            return Err<TextureHandle>("WebGPUPenGpu: failed to create " + std::to_string(width) +
                                      "x" + std::to_string(height) + " texture");
        }
        WGPUTextureView view = wgpuTextureCreateView(texture, nullptr);
        if (!view) {
            wgpuTextureRelease(texture);
            return Err<TextureHandle>("WebGPUPenGpu: failed to create texture view");
        }

        TextureHandle handle{_nextHandle++};
        _textures[handle.id] = TextureEntry{texture, view, width, height};
        spdlog::info("WebGPUPenGpu: texture {} {}x{} ({} bytes)", handle.id, width, height,
                     static_cast<uint64_t>(width) * height * 4);
        return Ok(handle);
    }

    void releaseTexture(TextureHandle texture) override {
        auto it = _textures.find(texture.id);
        if (it == _textures.end()) return;
        if (it->second.view) wgpuTextureViewRelease(it->second.view);
        if (it->second.texture) wgpuTextureRelease(it->second.texture);
        _textures.erase(it);
    }

    Result<void> writeTexture(TextureHandle texture, const uint8_t* rgba,
                              uint32_t width, uint32_t height) override {
        auto it = _textures.find(texture.id);
        if (it == _textures.end()) {
            return Err<void>("WebGPUPenGpu::writeTexture: unknown texture " + std::to_string(texture.id));
        }
        if (it->second.width != width || it->second.height != height) {
            return Err<void>("WebGPUPenGpu::writeTexture: size mismatch");
        }

        WGPUTexelCopyTextureInfo dst = {};
        dst.texture = it->second.texture;
        WGPUTexelCopyBufferLayout layout = {};
        layout.bytesPerRow = width * 4;
        layout.rowsPerImage = height;
        WGPUExtent3D extent = {width, height, 1};
        wgpuQueueWriteTexture(_gpu.queue, &dst, rgba, static_cast<size_t>(width) * height * 4,
                              &layout, &extent);
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Framebuffers
    //-------------------------------------------------------------------------

    Result<FramebufferHandle> createFramebuffer(TextureHandle attachment) override {
        auto it = _textures.find(attachment.id);
        if (it == _textures.end()) {
            return Err<FramebufferHandle>("WebGPUPenGpu::createFramebuffer: unknown attachment " +
                                          std::to_string(attachment.id));
        }
        WGPUTextureView view = wgpuTextureCreateView(it->second.texture, nullptr);
        if (!view) {
            return Err<FramebufferHandle>("WebGPUPenGpu: failed to create framebuffer view");
        }

        FramebufferHandle handle{_nextHandle++};
        _framebuffers[handle.id] = FramebufferEntry{attachment, view, it->second.width, it->second.height};
        return Ok(handle);
    }

    void releaseFramebuffer(FramebufferHandle framebuffer) override {
        auto it = _framebuffers.find(framebuffer.id);
        if (it == _framebuffers.end()) return;
        if (_pass && _pass->target == framebuffer) {
            _pass.reset();
        }
        if (it->second.view) wgpuTextureViewRelease(it->second.view);
        _framebuffers.erase(it);
    }

    //-------------------------------------------------------------------------
    // Line buffers
    //-------------------------------------------------------------------------

    Result<LineBufferHandle> createLineBuffers(const LineBatch& batch) override {
        LineBuffersEntry entry;
        auto createVertexBuffer = [this](uint64_t size, const char* name) -> Result<WGPUBuffer> {
            WGPUBufferDescriptor desc = {};
            desc.label = WGPU_STR(name);
            desc.size = size;
            desc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
            WGPUBuffer buffer = wgpuDeviceCreateBuffer(_gpu.device, &desc);
            if (!buffer) {
                return Err<WGPUBuffer>(std::string("WebGPUPenGpu: failed to create ") + name + " buffer");
            }
            return Ok(buffer);
        };

        entry.cornerSize = batch.cornerTemplate().size() * sizeof(float);
        entry.colorSize = batch.lineColor().size() * sizeof(float);
        entry.thicknessSize = batch.lineThicknessAndLength().size() * sizeof(float);
        entry.pointsSize = batch.penPoints().size() * sizeof(float);

        auto corners = createVertexBuffer(entry.cornerSize, "corner");
        auto color = corners ? createVertexBuffer(entry.colorSize, "color") : corners;
        auto thickness = color ? createVertexBuffer(entry.thicknessSize, "thickness") : color;
        auto points = thickness ? createVertexBuffer(entry.pointsSize, "points") : thickness;
        entry.corners = corners.value_or(nullptr);
        entry.color = color.value_or(nullptr);
        entry.thickness = thickness.value_or(nullptr);
        entry.points = points.value_or(nullptr);
        if (!points) {
            releaseEntry(entry);
            return Err<LineBufferHandle>("WebGPUPenGpu::createLineBuffers", points);
        }

        wgpuQueueWriteBuffer(_gpu.queue, entry.corners, 0, batch.cornerTemplate().data(), entry.cornerSize);

        LineBufferHandle handle{_nextHandle++};
        _lineBuffers[handle.id] = entry;
        spdlog::info("WebGPUPenGpu: line buffers {} for {} segments ({} bytes)", handle.id,
                     batch.segmentCapacity(),
                     entry.cornerSize + entry.colorSize + entry.thicknessSize + entry.pointsSize);
        return Ok(handle);
    }

    void releaseLineBuffers(LineBufferHandle buffers) override {
        auto it = _lineBuffers.find(buffers.id);
        if (it == _lineBuffers.end()) return;
        releaseEntry(it->second);
        _lineBuffers.erase(it);
    }

    Result<void> uploadLines(LineBufferHandle buffers, const LineBatch& batch, bool partial) override {
        auto it = _lineBuffers.find(buffers.id);
        if (it == _lineBuffers.end()) {
            return Err<void>("WebGPUPenGpu::uploadLines: unknown line buffers " + std::to_string(buffers.id));
        }
        const LineBuffersEntry& entry = it->second;

        if (partial) {
            if (batch.empty()) return Ok();
            wgpuQueueWriteBuffer(_gpu.queue, entry.color, 0, batch.lineColor().data(),
                                 batch.colorCursor() * sizeof(float));
            wgpuQueueWriteBuffer(_gpu.queue, entry.points, 0, batch.penPoints().data(),
                                 batch.pointsCursor() * sizeof(float));
            wgpuQueueWriteBuffer(_gpu.queue, entry.thickness, 0, batch.lineThicknessAndLength().data(),
                                 batch.thicknessCursor() * sizeof(float));
        } else {
            wgpuQueueWriteBuffer(_gpu.queue, entry.color, 0, batch.lineColor().data(), entry.colorSize);
            wgpuQueueWriteBuffer(_gpu.queue, entry.points, 0, batch.penPoints().data(), entry.pointsSize);
            wgpuQueueWriteBuffer(_gpu.queue, entry.thickness, 0, batch.lineThicknessAndLength().data(),
                                 entry.thicknessSize);
        }
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Passes and draws
    //-------------------------------------------------------------------------

    Result<void> beginPass(FramebufferHandle target, const Program& program,
                           const Viewport& viewport) override {
        if (!_framebuffers.count(target.id)) {
            return Err<void>("WebGPUPenGpu::beginPass: unknown framebuffer " + std::to_string(target.id));
        }
        if (!program.pipeline || !program.bindGroupLayout) {
            return Err<void>(std::string("WebGPUPenGpu::beginPass: program '") +
                             drawModeName(program.mode) + "' has no pipeline");
        }
        _pass = ActivePass{target, program, viewport};
        return Ok();
    }

    Result<void> endPass() override {
        _pass.reset();
        return Ok();
    }

    Result<void> clear(FramebufferHandle target, const Color4f& color) override {
        auto it = _framebuffers.find(target.id);
        if (it == _framebuffers.end()) {
            return Err<void>("WebGPUPenGpu::clear: unknown framebuffer " + std::to_string(target.id));
        }

        WGPUCommandEncoderDescriptor encoderDesc = {};
        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_gpu.device, &encoderDesc);
        if (!encoder) {
            return Err<void>("WebGPUPenGpu: failed to create command encoder");
        }

        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = it->second.view;
        colorAttachment.loadOp = WGPULoadOp_Clear;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
        WGPU_COLOR_ATTACHMENT_CLEAR(colorAttachment, color[0], color[1], color[2], color[3]);

        WGPURenderPassDescriptor passDesc = {};
        passDesc.colorAttachmentCount = 1;
        passDesc.colorAttachments = &colorAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
        if (!pass) {
            wgpuCommandEncoderRelease(encoder);
            return Err<void>("WebGPUPenGpu: failed to begin clear pass");
        }
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);

        return submit(encoder);
    }

    Result<void> drawLines(LineBufferHandle buffers, uint32_t vertexCount,
                           const LineUniforms& uniforms) override {
        if (!_pass) {
            return Err<void>("WebGPUPenGpu::drawLines: no active pass");
        }
        if (_pass->program.mode != DrawMode::Line) {
            return Err<void>(std::string("WebGPUPenGpu::drawLines: active program is '") +
                             drawModeName(_pass->program.mode) + "'");
        }
        auto it = _lineBuffers.find(buffers.id);
        if (it == _lineBuffers.end()) {
            return Err<void>("WebGPUPenGpu::drawLines: unknown line buffers " + std::to_string(buffers.id));
        }
        if (vertexCount == 0) return Ok();

        wgpuQueueWriteBuffer(_gpu.queue, _lineUniformBuffer, 0, &uniforms, sizeof(LineUniforms));

        WGPUBindGroupEntry bgEntry = {};
        bgEntry.binding = 0;
        bgEntry.buffer = _lineUniformBuffer;
        bgEntry.offset = 0;
        bgEntry.size = sizeof(LineUniforms);

        WGPUBindGroupDescriptor bgDesc = {};
        bgDesc.layout = _pass->program.bindGroupLayout;
        bgDesc.entryCount = 1;
        bgDesc.entries = &bgEntry;
        WGPUBindGroup bindGroup = wgpuDeviceCreateBindGroup(_gpu.device, &bgDesc);
        if (!bindGroup) {
            return Err<void>("WebGPUPenGpu: failed to create line bind group");
        }

        const LineBuffersEntry& entry = it->second;
        auto res = encodeDraw(bindGroup, [&](WGPURenderPassEncoder pass) {
            wgpuRenderPassEncoderSetVertexBuffer(pass, 0, entry.corners, 0, entry.cornerSize);
            wgpuRenderPassEncoderSetVertexBuffer(pass, 1, entry.color, 0, entry.colorSize);
            wgpuRenderPassEncoderSetVertexBuffer(pass, 2, entry.thickness, 0, entry.thicknessSize);
            wgpuRenderPassEncoderSetVertexBuffer(pass, 3, entry.points, 0, entry.pointsSize);
            wgpuRenderPassEncoderDraw(pass, vertexCount, 1, 0, 0);
        });
        wgpuBindGroupRelease(bindGroup);
        return res;
    }

    Result<void> drawQuad(TextureHandle source, const QuadUniforms& uniforms) override {
        if (!_pass) {
            return Err<void>("WebGPUPenGpu::drawQuad: no active pass");
        }
        auto it = _textures.find(source.id);
        if (it == _textures.end()) {
            return Err<void>("WebGPUPenGpu::drawQuad: unknown texture " + std::to_string(source.id));
        }
        const FramebufferEntry& target = _framebuffers.at(_pass->target.id);
        if (target.attachment == source) {
            return Err<void>("WebGPUPenGpu::drawQuad: source is the bound attachment");
        }
        WGPUBuffer quad = _shaders->quadVertexBuffer();
        if (!quad) {
            return Err<void>("WebGPUPenGpu::drawQuad: no quad vertex buffer");
        }

        wgpuQueueWriteBuffer(_gpu.queue, _quadUniformBuffer, 0, &uniforms, sizeof(QuadUniforms));

        WGPUBindGroupEntry bgEntries[3] = {};
        bgEntries[0].binding = 0;
        bgEntries[0].buffer = _quadUniformBuffer;
        bgEntries[0].offset = 0;
        bgEntries[0].size = sizeof(QuadUniforms);
        bgEntries[1].binding = 1;
        bgEntries[1].sampler = _sampler;
        bgEntries[2].binding = 2;
        bgEntries[2].textureView = it->second.view;

        WGPUBindGroupDescriptor bgDesc = {};
        bgDesc.layout = _pass->program.bindGroupLayout;
        bgDesc.entryCount = 3;
        bgDesc.entries = bgEntries;
        WGPUBindGroup bindGroup = wgpuDeviceCreateBindGroup(_gpu.device, &bgDesc);
        if (!bindGroup) {
            return Err<void>("WebGPUPenGpu: failed to create quad bind group");
        }

        auto res = encodeDraw(bindGroup, [&](WGPURenderPassEncoder pass) {
            wgpuRenderPassEncoderSetVertexBuffer(pass, 0, quad, 0, WGPU_WHOLE_SIZE);
            wgpuRenderPassEncoderDraw(pass, 6, 1, 0, 0);
        });
        wgpuBindGroupRelease(bindGroup);
        return res;
    }

    //-------------------------------------------------------------------------
    // Readback
    //-------------------------------------------------------------------------

    Result<void> readPixels(FramebufferHandle source, std::vector<uint8_t>& out) override {
        auto it = _framebuffers.find(source.id);
        if (it == _framebuffers.end()) {
            return Err<void>("WebGPUPenGpu::readPixels: unknown framebuffer " + std::to_string(source.id));
        }
        const FramebufferEntry& fb = it->second;
        const TextureEntry& texture = _textures.at(fb.attachment.id);

        const uint32_t width = fb.width;
        const uint32_t height = fb.height;
        const uint32_t paddedRow = alignedBytesPerRow(width);
        const uint64_t bufSize = static_cast<uint64_t>(paddedRow) * height;

        if (!_readbackBuffer || _readbackSize != bufSize) {
            if (_readbackBuffer) wgpuBufferRelease(_readbackBuffer);
            WGPUBufferDescriptor bufDesc = {};
            bufDesc.label = WGPU_STR("pen readback");
            bufDesc.size = bufSize;
            bufDesc.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
            _readbackBuffer = wgpuDeviceCreateBuffer(_gpu.device, &bufDesc);
            _readbackSize = _readbackBuffer ? bufSize : 0;
            if (!_readbackBuffer) {
                return Err<void>("WebGPUPenGpu: failed to create readback buffer");
            }
            spdlog::info("WebGPUPenGpu: readback buffer {} bytes", bufSize);
        }

        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_gpu.device, nullptr);
        if (!encoder) {
            return Err<void>("WebGPUPenGpu: failed to create command encoder");
        }
        WGPUTexelCopyTextureInfo src = {};
        src.texture = texture.texture;
        WGPUTexelCopyBufferInfo dst = {};
        dst.buffer = _readbackBuffer;
        dst.layout.bytesPerRow = paddedRow;
        dst.layout.rowsPerImage = height;
        WGPUExtent3D copySize = {width, height, 1};
        wgpuCommandEncoderCopyTextureToBuffer(encoder, &src, &dst, &copySize);
        if (auto res = submit(encoder); !res) {
            return res;
        }

        // Blocking map
        struct MapState {
            std::atomic<bool> done{false};
            WGPUMapAsyncStatus status = WGPUMapAsyncStatus_Error;
        } mapState;
        WGPUBufferMapCallbackInfo cbInfo = {};
        cbInfo.mode = WGPUCallbackMode_AllowSpontaneous;
        cbInfo.callback = [](WGPUMapAsyncStatus status, WGPUStringView, void* ud, void*) {
            auto* state = static_cast<MapState*>(ud);
            state->status = status;
            state->done = true;
        };
        cbInfo.userdata1 = &mapState;
        wgpuBufferMapAsync(_readbackBuffer, WGPUMapMode_Read, 0, bufSize, cbInfo);
        while (!mapState.done) {
            WGPU_DEVICE_TICK(_gpu.device);
        }
        if (mapState.status != WGPUMapAsyncStatus_Success) {
            return Err<void>("WebGPUPenGpu: readback map failed (status " +
                             std::to_string(static_cast<int>(mapState.status)) + ")");
        }

        const uint8_t* mapped = static_cast<const uint8_t*>(
            wgpuBufferGetConstMappedRange(_readbackBuffer, 0, bufSize));
        if (!mapped) {
            wgpuBufferUnmap(_readbackBuffer);
            return Err<void>("WebGPUPenGpu: readback mapped range is null");
        }

        const uint32_t unalignedRow = width * 4;
        out.resize(static_cast<size_t>(unalignedRow) * height);
        for (uint32_t y = 0; y < height; y++) {
            std::memcpy(out.data() + static_cast<size_t>(y) * unalignedRow,
                        mapped + static_cast<size_t>(y) * paddedRow, unalignedRow);
        }
        wgpuBufferUnmap(_readbackBuffer);
        return Ok();
    }

private:
    struct TextureEntry {
        WGPUTexture texture = nullptr;
        WGPUTextureView view = nullptr;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    struct FramebufferEntry {
        TextureHandle attachment;
        WGPUTextureView view = nullptr;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    struct LineBuffersEntry {
        WGPUBuffer corners = nullptr;
        WGPUBuffer color = nullptr;
        WGPUBuffer thickness = nullptr;
        WGPUBuffer points = nullptr;
        uint64_t cornerSize = 0;
        uint64_t colorSize = 0;
        uint64_t thicknessSize = 0;
        uint64_t pointsSize = 0;
    };

    struct ActivePass {
        FramebufferHandle target;
        Program program;
        Viewport viewport;
    };

    static void releaseEntry(LineBuffersEntry& entry) {
        if (entry.corners) { wgpuBufferRelease(entry.corners); entry.corners = nullptr; }
        if (entry.color) { wgpuBufferRelease(entry.color); entry.color = nullptr; }
        if (entry.thickness) { wgpuBufferRelease(entry.thickness); entry.thickness = nullptr; }
        if (entry.points) { wgpuBufferRelease(entry.points); entry.points = nullptr; }
    }

    // Encodes one load/store pass on the active target with the active
    // program, lets record() bind vertex buffers and draw, then submits.
    template<typename Fn>
    Result<void> encodeDraw(WGPUBindGroup bindGroup, Fn&& record) {
        const FramebufferEntry& target = _framebuffers.at(_pass->target.id);

        WGPUCommandEncoderDescriptor encoderDesc = {};
        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(_gpu.device, &encoderDesc);
        if (!encoder) {
            return Err<void>("WebGPUPenGpu: failed to create command encoder");
        }

        WGPURenderPassColorAttachment colorAttachment = {};
        colorAttachment.view = target.view;
        colorAttachment.loadOp = WGPULoadOp_Load;
        colorAttachment.storeOp = WGPUStoreOp_Store;
        colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;

        WGPURenderPassDescriptor passDesc = {};
        passDesc.colorAttachmentCount = 1;
        passDesc.colorAttachments = &colorAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
        if (!pass) {
            wgpuCommandEncoderRelease(encoder);
            return Err<void>("WebGPUPenGpu: failed to begin render pass");
        }

        const Viewport& vp = _pass->viewport;
        wgpuRenderPassEncoderSetViewport(pass, static_cast<float>(vp.x), static_cast<float>(vp.y),
                                         static_cast<float>(vp.width), static_cast<float>(vp.height),
                                         0.0f, 1.0f);
        wgpuRenderPassEncoderSetPipeline(pass, _pass->program.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, bindGroup, 0, nullptr);
        record(pass);
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);

        return submit(encoder);
    }

    // Finishes, submits and releases encoder
    Result<void> submit(WGPUCommandEncoder encoder) {
        WGPUCommandBufferDescriptor cmdDesc = {};
        WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
        if (!cmdBuffer) {
            wgpuCommandEncoderRelease(encoder);
            return Err<void>("WebGPUPenGpu: failed to finish command encoder");
        }
        wgpuQueueSubmit(_gpu.queue, 1, &cmdBuffer);
        wgpuCommandBufferRelease(cmdBuffer);
        wgpuCommandEncoderRelease(encoder);
        return Ok();
    }

    void dispose() {
        _pass.reset();
        for (auto& [id, entry] : _lineBuffers) releaseEntry(entry);
        _lineBuffers.clear();
        for (auto& [id, fb] : _framebuffers) {
            if (fb.view) wgpuTextureViewRelease(fb.view);
        }
        _framebuffers.clear();
        for (auto& [id, tex] : _textures) {
            if (tex.view) wgpuTextureViewRelease(tex.view);
            if (tex.texture) wgpuTextureRelease(tex.texture);
        }
        _textures.clear();
        if (_readbackBuffer) { wgpuBufferRelease(_readbackBuffer); _readbackBuffer = nullptr; }
        if (_lineUniformBuffer) { wgpuBufferRelease(_lineUniformBuffer); _lineUniformBuffer = nullptr; }
        if (_quadUniformBuffer) { wgpuBufferRelease(_quadUniformBuffer); _quadUniformBuffer = nullptr; }
        if (_sampler) { wgpuSamplerRelease(_sampler); _sampler = nullptr; }
    }

    GPUContext _gpu;
    ShaderCache::Ptr _shaders;

    WGPUSampler _sampler = nullptr;
    WGPUBuffer _quadUniformBuffer = nullptr;
    WGPUBuffer _lineUniformBuffer = nullptr;
    WGPUBuffer _readbackBuffer = nullptr;
    uint64_t _readbackSize = 0;

    std::unordered_map<uint32_t, TextureEntry> _textures;
    std::unordered_map<uint32_t, FramebufferEntry> _framebuffers;
    std::unordered_map<uint32_t, LineBuffersEntry> _lineBuffers;
    std::optional<ActivePass> _pass;
    uint32_t _nextHandle = 1;
};

Result<WebGPUPenGpu::Ptr> WebGPUPenGpu::create(const GPUContext& gpu, ShaderCache::Ptr shaders) noexcept {
    auto impl = std::make_shared<WebGPUPenGpuImpl>(gpu, std::move(shaders));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to init WebGPUPenGpu", res);
    }
    return Ok<Ptr>(impl);
}

} // namespace inkwell
