#include "../common/host_facade.hpp"

#include <multidraw/core/base/common_context.hpp>
#include <multidraw/core/rhi/draw_commands_buffer.hpp>

#include <gtest/gtest.h>

#include <array>
#include <functional>
#include <vector>

using namespace multidraw;
using namespace multidraw::rhi;

namespace
{
    using NoIndicesFactory = std::function<std::expected<DrawCommandsNoIndicesBuffer, BufferCreationError>(
        const Facade&, std::size_t)>;
    using IndicesFactory =
        std::function<std::expected<DrawCommandsIndicesBuffer, BufferCreationError>(const Facade&, std::size_t)>;

    struct Strategy
    {
        BufferMode       mode;
        NoIndicesFactory noIndices;
        IndicesFactory   indices;
    };

    std::vector<Strategy> allStrategies()
    {
        return {
            {BufferMode::eDefault, &DrawCommandsNoIndicesBuffer::empty, &DrawCommandsIndicesBuffer::empty},
            {BufferMode::eDynamic,
             &DrawCommandsNoIndicesBuffer::emptyDynamic,
             &DrawCommandsIndicesBuffer::emptyDynamic},
            {BufferMode::ePersistent,
             &DrawCommandsNoIndicesBuffer::emptyPersistent,
             &DrawCommandsIndicesBuffer::emptyPersistent},
            {BufferMode::eImmutable,
             &DrawCommandsNoIndicesBuffer::emptyImmutable,
             &DrawCommandsIndicesBuffer::emptyImmutable},
        };
    }

    TEST(DrawCommandsBuffer, EachStrategyAllocatesIndirectStorage)
    {
        for (const auto& strategy : allStrategies())
        {
            test::HostFacade facade;

            for (const std::size_t elements : {0u, 1u, 5u})
            {
                const auto noIndices = strategy.noIndices(facade, elements);
                ASSERT_TRUE(noIndices.has_value());
                EXPECT_EQ((*noIndices)->getElementCount(), elements);

                const auto indices = strategy.indices(facade, elements);
                ASSERT_TRUE(indices.has_value());
                EXPECT_EQ(indices->getView().getElementCount(), elements);
            }

            ASSERT_EQ(facade.getRequests().size(), 6u);
            for (const auto& request : facade.getRequests())
            {
                EXPECT_EQ(request.type, BufferType::eDrawIndirectBuffer);
                EXPECT_EQ(request.mode, strategy.mode);
            }
            EXPECT_EQ(facade.getRequests()[0].size, 0u);
            EXPECT_EQ(facade.getRequests()[4].size, 5 * sizeof(DrawCommandNoIndices));
            EXPECT_EQ(facade.getRequests()[5].size, 5 * sizeof(DrawCommandIndices));
        }
    }

    TEST(DrawCommandsBuffer, CreationFailuresArePropagatedAndLogged)
    {
        const std::array kinds {
            BufferCreationError::Kind::eOutOfMemory,
            BufferCreationError::Kind::eUnsupportedUsage,
            BufferCreationError::Kind::eSizeLimitExceeded,
        };

        for (const auto kind : kinds)
        {
            test::HostFacade facade;
            facade.failNextWith({kind, "rejected"});

            const auto buffer = DrawCommandsIndicesBuffer::emptyPersistent(facade, 8);
            ASSERT_FALSE(buffer.has_value());
            EXPECT_EQ(buffer.error().kind, kind);
            EXPECT_EQ(buffer.error().message, "rejected");
        }

        std::vector<LogEvent> errors;
        commonContext.logger.on<LogEvent>([&errors](const LogEvent& event, Logger&) {
            if (event.level == Logger::Level::eError)
            {
                errors.push_back(event);
            }
        });

        test::HostFacade facade;
        const auto       tooLarge = DrawCommandsNoIndicesBuffer::empty(facade, std::size_t {1} << 40);
        ASSERT_FALSE(tooLarge.has_value());
        EXPECT_EQ(tooLarge.error().kind, BufferCreationError::Kind::eSizeLimitExceeded);
        EXPECT_FALSE(errors.empty());

        commonContext.logger.erase<LogEvent>();
    }

    TEST(DrawCommandsBuffer, ForwardsToTheView)
    {
        test::HostFacade facade;

        auto buffer = DrawCommandsNoIndicesBuffer::emptyDynamic(facade, 2);
        ASSERT_TRUE(buffer.has_value());

        const DrawCommandNoIndices first {.count = 3, .instanceCount = 1};
        const DrawCommandNoIndices second {.count = 6, .instanceCount = 2, .firstIndex = 3};

        (*buffer)->write(0, first);
        {
            auto mapping = (*buffer)->map();
            mapping[1]   = second;
        }

        EXPECT_EQ((*buffer)->read(), (std::vector {first, second}));
        EXPECT_EQ((**buffer).read(1), second);
        EXPECT_EQ(buffer->getView().getBuffer().getType(), BufferType::eDrawIndirectBuffer);
    }

    TEST(DrawCommandsBuffer, NonIndexedScenario)
    {
        test::HostFacade facade;

        auto buffer = DrawCommandsNoIndicesBuffer::empty(facade, 3);
        ASSERT_TRUE(buffer.has_value());

        const std::array<DrawCommandNoIndices, 3> commands {{
            {.count = 3, .instanceCount = 1, .firstIndex = 0, .baseInstance = 0},
            {.count = 6, .instanceCount = 2, .firstIndex = 3, .baseInstance = 0},
            {.count = 0, .instanceCount = 0, .firstIndex = 0, .baseInstance = 0},
        }};
        (*buffer)->write(commands);

        const auto source = buffer->withPrimitiveTopology(PrimitiveTopology::eTriangleList);

        EXPECT_FALSE(source.isIndexed());
        EXPECT_EQ(source.getType(), DrawIndirectType::eNonIndexed);
        EXPECT_EQ(source.getPrimitiveTopology(), PrimitiveTopology::eTriangleList);
        EXPECT_EQ(source.getDrawCount(), 3u);

        const auto* array = std::get_if<MultidrawArray>(&source.get());
        ASSERT_NE(array, nullptr);
        EXPECT_EQ(array->commands.handle, (*buffer)->getBuffer().getHandle());
        EXPECT_EQ(array->commands.offset, 0u);
        EXPECT_EQ(array->commands.size, 3 * sizeof(DrawCommandNoIndices));
        EXPECT_EQ(array->commands.stride, sizeof(DrawCommandNoIndices));

        // Borrowed, not copied: the source sees the device memory itself.
        const auto& bytes = facade.getAllocation(0)->getBytes();
        EXPECT_EQ(std::memcmp(bytes.data(), commands.data(), sizeof(commands)), 0);
        EXPECT_EQ(facade.getRequests().size(), 1u);
    }

    TEST(DrawCommandsBuffer, TopologyIsTakenAsGiven)
    {
        test::HostFacade facade;

        auto buffer = DrawCommandsNoIndicesBuffer::empty(facade, 1);
        ASSERT_TRUE(buffer.has_value());

        for (const auto topology :
             {PrimitiveTopology::ePointList, PrimitiveTopology::eLineStrip, PrimitiveTopology::eTriangleFan})
        {
            EXPECT_EQ(buffer->withPrimitiveTopology(topology).getPrimitiveTopology(), topology);
        }
    }

    TEST(DrawCommandsBuffer, IndexedScenario)
    {
        test::HostFacade facade;

        std::vector<uint16_t> indices(100);
        for (std::size_t i = 0; i < indices.size(); ++i)
        {
            indices[i] = static_cast<uint16_t>(i % 64);
        }
        auto indexBuffer =
            IndexBuffer::fromIndices<uint16_t>(facade, PrimitiveTopology::eTriangleList, indices);
        ASSERT_TRUE(indexBuffer.has_value());

        auto buffer = DrawCommandsIndicesBuffer::empty(facade, 1);
        ASSERT_TRUE(buffer.has_value());
        (*buffer)->write(0, {.count = 100, .instanceCount = 1, .firstIndex = 0, .baseVertex = 0, .baseInstance = 0});

        const auto source = buffer->withIndexBuffer(*indexBuffer);

        EXPECT_TRUE(source.isIndexed());
        EXPECT_EQ(source.getPrimitiveTopology(), PrimitiveTopology::eTriangleList);
        EXPECT_EQ(source.getDrawCount(), 1u);

        const auto* element = std::get_if<MultidrawElement>(&source.get());
        ASSERT_NE(element, nullptr);
        EXPECT_EQ(element->dataType, IndexType::eUInt16);
        EXPECT_EQ(element->primitives, PrimitiveTopology::eTriangleList);
        EXPECT_EQ(element->commands.handle, (*buffer)->getBuffer().getHandle());
        EXPECT_EQ(element->indices.handle, indexBuffer->getHandle());
        EXPECT_EQ(element->indices.size, 100 * sizeof(uint16_t));
        EXPECT_EQ(element->indices.getElementCount(), 100u);
        EXPECT_NE(element->commands.handle, element->indices.handle);
        EXPECT_TRUE(source.isAlive());
    }

    TEST(DrawCommandsBuffer, TopologyAndTypeComeFromTheIndexBuffer)
    {
        test::HostFacade facade;

        auto indexBuffer =
            IndexBuffer::create(facade, IndexType::eUInt32, PrimitiveTopology::eLineList, 32, BufferMode::eImmutable);
        ASSERT_TRUE(indexBuffer.has_value());

        auto buffer = DrawCommandsIndicesBuffer::emptyImmutable(facade, 4);
        ASSERT_TRUE(buffer.has_value());

        const auto source   = buffer->withIndexBuffer(*indexBuffer);
        const auto& element = std::get<MultidrawElement>(source.get());
        EXPECT_EQ(element.dataType, IndexType::eUInt32);
        EXPECT_EQ(element.primitives, PrimitiveTopology::eLineList);
        EXPECT_EQ(source.getDrawCount(), 4u);
    }

    TEST(DrawCommandsBuffer, ZeroInstanceRecordsAreValid)
    {
        test::HostFacade facade;

        auto buffer = DrawCommandsIndicesBuffer::empty(facade, 2);
        ASSERT_TRUE(buffer.has_value());

        (*buffer)->write(std::array<DrawCommandIndices, 2> {{{.count = 3, .instanceCount = 0}, {}}});
        EXPECT_EQ((*buffer)->read(0).instanceCount, 0u);
        EXPECT_EQ((*buffer)->read(1), DrawCommandIndices {});
    }

    TEST(DrawCommandsBuffer, ZeroElementsYieldAnEmptySource)
    {
        test::HostFacade facade;

        auto noIndices = DrawCommandsNoIndicesBuffer::empty(facade, 0);
        ASSERT_TRUE(noIndices.has_value());
        const auto arraySource = noIndices->withPrimitiveTopology(PrimitiveTopology::ePointList);
        EXPECT_EQ(arraySource.getDrawCount(), 0u);
        EXPECT_TRUE(arraySource.isAlive());

        auto indexBuffer = IndexBuffer::create(facade, IndexType::eUInt16, PrimitiveTopology::eTriangleStrip, 4);
        ASSERT_TRUE(indexBuffer.has_value());
        auto indices = DrawCommandsIndicesBuffer::emptyPersistent(facade, 0);
        ASSERT_TRUE(indices.has_value());
        const auto elementSource = indices->withIndexBuffer(*indexBuffer);
        EXPECT_EQ(elementSource.getDrawCount(), 0u);
        EXPECT_EQ(elementSource.getPrimitiveTopology(), PrimitiveTopology::eTriangleStrip);
    }

    TEST(DrawCommandsBuffer, SourceNoticesDestroyedBuffers)
    {
        test::HostFacade facade;

        auto indexBuffer = IndexBuffer::create(facade, IndexType::eUInt32, PrimitiveTopology::eTriangleList, 3);
        ASSERT_TRUE(indexBuffer.has_value());

        std::optional<IndicesSource> source;
        {
            auto buffer = DrawCommandsIndicesBuffer::empty(facade, 1);
            ASSERT_TRUE(buffer.has_value());
            source = buffer->withIndexBuffer(*indexBuffer);
            EXPECT_TRUE(source->isAlive());
        }
        EXPECT_FALSE(source->isAlive());

        auto buffer = DrawCommandsIndicesBuffer::empty(facade, 1);
        ASSERT_TRUE(buffer.has_value());
        source = buffer->withIndexBuffer(*indexBuffer);
        indexBuffer = IndexBuffer {};
        EXPECT_FALSE(source->isAlive());
    }

    TEST(DrawCommandsBuffer, MovingKeepsTheStorage)
    {
        test::HostFacade facade;

        auto buffer = DrawCommandsNoIndicesBuffer::empty(facade, 1);
        ASSERT_TRUE(buffer.has_value());
        (*buffer)->write(0, {.count = 9, .instanceCount = 1});

        const auto source = buffer->withPrimitiveTopology(PrimitiveTopology::eTriangleList);

        DrawCommandsNoIndicesBuffer moved = std::move(*buffer);
        EXPECT_EQ(moved->getElementCount(), 1u);
        EXPECT_EQ(moved->read(0).count, 9u);
        EXPECT_TRUE(source.isAlive());
        EXPECT_EQ(source.getCommands().handle, moved->getBuffer().getHandle());
    }

    TEST(DrawCommandsBuffer, SourceAfterMappingScopeEnds)
    {
        test::HostFacade facade;

        auto buffer = DrawCommandsNoIndicesBuffer::empty(facade, 2);
        ASSERT_TRUE(buffer.has_value());
        {
            auto mapping = (*buffer)->map();
            mapping[1]   = {.count = 3, .instanceCount = 1};
            EXPECT_TRUE((*buffer)->hasActiveMapping());
        }
        EXPECT_FALSE((*buffer)->hasActiveMapping());

        const auto source = buffer->withPrimitiveTopology(PrimitiveTopology::eLineList);
        EXPECT_EQ(source.getDrawCount(), 2u);
    }

    TEST(DrawCommandsBufferDeathTest, SourceUnderLiveMappingAsserts)
    {
#ifdef NDEBUG
        GTEST_SKIP() << "debug assertions are compiled out";
#else
        test::HostFacade facade;

        auto buffer = DrawCommandsIndicesBuffer::empty(facade, 2);
        ASSERT_TRUE(buffer.has_value());
        auto indexBuffer = IndexBuffer::create(facade, IndexType::eUInt32, PrimitiveTopology::eTriangleList, 6);
        ASSERT_TRUE(indexBuffer.has_value());

        EXPECT_DEATH(
            {
                auto mapping = (*buffer)->map();
                [[maybe_unused]] const auto source = buffer->withIndexBuffer(*indexBuffer);
            },
            "");
#endif
    }
} // namespace
