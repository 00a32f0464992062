#include <multidraw/core/base/common_context.hpp>
#include <multidraw/core/rhi/draw_commands_buffer.hpp>
#include <multidraw/core/rhi/render_device.hpp>

#include <gtest/gtest.h>

#include <bit>
#include <cstdint>
#include <vector>

using namespace multidraw;
using namespace multidraw::rhi;

namespace
{
    // Never dereferenced: every case below returns before reaching VMA.
    vma::Allocator unusedAllocator() { return vma::Allocator {std::bit_cast<VmaAllocator>(std::uintptr_t {0x1})}; }

    class RenderDeviceTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            commonContext.logger.on<LogEvent>([this](const LogEvent& event, Logger&) {
                if (event.level >= Logger::Level::eError)
                    errors.push_back(event);
            });
        }

        void TearDown() override { commonContext.logger.erase<LogEvent>(); }

        std::vector<LogEvent> errors;
    };

    TEST_F(RenderDeviceTest, ZeroSizeYieldsAnEmptyBuffer)
    {
        const RenderDevice device {unusedAllocator(), DeviceCapabilities {}};

        for (const auto type : {BufferType::eVertexBuffer, BufferType::eIndexBuffer, BufferType::eDrawIndirectBuffer})
        {
            const auto buffer = device.createBuffer(type, 0, BufferMode::ePersistent);
            ASSERT_TRUE(buffer.has_value());
            EXPECT_FALSE(*buffer);
            EXPECT_EQ(buffer->getType(), type);
            EXPECT_EQ(buffer->getMode(), BufferMode::ePersistent);
            EXPECT_EQ(buffer->getSize(), 0u);
            EXPECT_FALSE(buffer->isMapped());
        }
        EXPECT_TRUE(errors.empty());
    }

    TEST_F(RenderDeviceTest, RejectsSizesAboveTheAllocationLimit)
    {
        const RenderDevice device {unusedAllocator(), DeviceCapabilities {.maxMemoryAllocationSize = 1024}};

        const auto buffer = device.createBuffer(BufferType::eVertexBuffer, 1025, BufferMode::eDefault);
        ASSERT_FALSE(buffer.has_value());
        EXPECT_EQ(buffer.error().kind, BufferCreationError::Kind::eSizeLimitExceeded);

        ASSERT_EQ(errors.size(), 1u);
        EXPECT_EQ(errors[0].region, Logger::Region::eCore);
        EXPECT_NE(errors[0].msg.find("eSizeLimitExceeded"), std::string::npos);
    }

    TEST_F(RenderDeviceTest, CommandBuffersFollowTheAllocationLimit)
    {
        const RenderDevice device {unusedAllocator(),
                                   DeviceCapabilities {.maxMemoryAllocationSize = 4 * sizeof(DrawCommandNoIndices)}};

        const auto tooLarge = DrawCommandsNoIndicesBuffer::empty(device, 5);
        ASSERT_FALSE(tooLarge.has_value());
        EXPECT_EQ(tooLarge.error().kind, BufferCreationError::Kind::eSizeLimitExceeded);
        EXPECT_EQ(errors.size(), 1u);
    }

    TEST_F(RenderDeviceTest, IndirectStorageDoesNotRequireMultiDrawIndirect)
    {
        const RenderDevice device {unusedAllocator(),
                                   DeviceCapabilities {.multiDrawIndirect = false, .maxMemoryAllocationSize = 64}};

        const auto empty = DrawCommandsIndicesBuffer::empty(device, 0);
        ASSERT_TRUE(empty.has_value());
        EXPECT_TRUE((*empty)->isEmpty());

        // The size check is the only device-side refusal.
        const auto tooLarge = device.createBuffer(BufferType::eDrawIndirectBuffer, 65, BufferMode::eDynamic);
        ASSERT_FALSE(tooLarge.has_value());
        EXPECT_EQ(tooLarge.error().kind, BufferCreationError::Kind::eSizeLimitExceeded);
    }

    TEST_F(RenderDeviceTest, ExposesItsCapabilities)
    {
        const DeviceCapabilities capabilities {
            .multiDrawIndirect         = false,
            .drawIndirectFirstInstance = false,
            .maxDrawIndirectCount      = 1,
            .maxMemoryAllocationSize   = 256,
        };
        const RenderDevice device {unusedAllocator(), capabilities};

        const Facade& facade = device;
        EXPECT_FALSE(facade.getCapabilities().multiDrawIndirect);
        EXPECT_FALSE(facade.getCapabilities().drawIndirectFirstInstance);
        EXPECT_EQ(facade.getCapabilities().maxDrawIndirectCount, 1u);
        EXPECT_EQ(facade.getCapabilities().maxMemoryAllocationSize, 256u);
    }
} // namespace
