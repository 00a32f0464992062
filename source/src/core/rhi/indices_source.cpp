#include "multidraw/core/rhi/indices_source.hpp"
#include "multidraw/core/base/visitor_helper.hpp"

namespace multidraw
{
    namespace rhi
    {
        IndicesSource::IndicesSource(MultidrawArray source) : m_Source(std::move(source)) {}

        IndicesSource::IndicesSource(MultidrawElement source) : m_Source(std::move(source)) {}

        const IndicesSource::Variant& IndicesSource::get() const { return m_Source; }

        DrawIndirectType IndicesSource::getType() const
        {
            return isIndexed() ? DrawIndirectType::eIndexed : DrawIndirectType::eNonIndexed;
        }

        bool IndicesSource::isIndexed() const { return std::holds_alternative<MultidrawElement>(m_Source); }

        PrimitiveTopology IndicesSource::getPrimitiveTopology() const
        {
            return std::visit([](const auto& source) { return source.primitives; }, m_Source);
        }

        const BufferAnySlice& IndicesSource::getCommands() const
        {
            return std::visit([](const auto& source) -> const BufferAnySlice& { return source.commands; }, m_Source);
        }

        uint32_t IndicesSource::getDrawCount() const { return getCommands().getElementCount(); }

        bool IndicesSource::isAlive() const
        {
            return std::visit(Overload {
                                  [](const MultidrawArray& source) { return source.commands.isAlive(); },
                                  [](const MultidrawElement& source) {
                                      return source.commands.isAlive() && source.indices.isAlive();
                                  },
                              },
                              m_Source);
        }
    } // namespace rhi
} // namespace multidraw
