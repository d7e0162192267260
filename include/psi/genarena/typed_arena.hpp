////////////////////////////////////////////////////////////////////////////////
/// Arena front end that deals exclusively in typed_index handles.
////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <psi/genarena/arena.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <ranges>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::genarena
{
//------------------------------------------------------------------------------

template
<
    typename T,
    std::unsigned_integral sz_t         = std::uint32_t,
    std::unsigned_integral generation_t = std::uint32_t,
    auto                   exhaustion_handler = throw_on_exhaustion{}
>
class typed_arena
{
public:
    using untyped_arena   = arena<T, sz_t, generation_t, exhaustion_handler>;
    using value_type      = T;
    using size_type       = typename untyped_arena::size_type;
    using generation_type = typename untyped_arena::generation_type;
    using index_type      = typename untyped_arena::typed_index_type;

    using       element_reference = std::pair<index_type, value_type       &>;
    using const_element_reference = std::pair<index_type, value_type const &>;

    constexpr typed_arena() noexcept = default;
    explicit  typed_arena( size_type const capacity ) : arena_( capacity ) {}

    [[ nodiscard, gnu::pure ]] size_type size      () const noexcept { return arena_.size      (); }
    [[ nodiscard, gnu::pure ]] bool      empty     () const noexcept { return arena_.empty     (); }
    [[ nodiscard, gnu::pure ]] size_type slot_count() const noexcept { return arena_.slot_count(); }
    [[ nodiscard, gnu::pure ]] size_type capacity  () const noexcept { return arena_.capacity  (); }
    [[ nodiscard ]] static constexpr size_type max_size() noexcept { return untyped_arena::max_size(); }

    void reserve( size_type const additional ) { arena_.reserve( additional ); }

    template <typename ...Args>
    index_type emplace( Args &&...args ) { return index_type{ arena_.emplace( std::forward<Args>( args )... ) }; }

    index_type insert( value_type const &  value ) { return arena_.typed_insert( value            ); }
    index_type insert( value_type       && value ) { return arena_.typed_insert( std::move( value ) ); }

    template <std::invocable<index_type> F>
    index_type insert_with( F && create ) { return arena_.typed_insert_with( std::forward<F>( create ) ); }

    fallible_result<index_type> try_insert( value_type const & value ) { return typed( arena_.try_insert( value ) ); }
    fallible_result<index_type> try_insert( value_type &&      value ) { return typed( arena_.try_insert( std::move( value ) ) ); }

    template <std::invocable<index_type> F>
    fallible_result<index_type> try_insert_with( F && create )
    {
        return typed
        (
            arena_.try_insert_with( [ &create ]( typename untyped_arena::index_type const idx ) { return std::invoke( create, index_type{ idx } ); } )
        );
    }

    std::optional<value_type> remove( index_type const idx ) { return arena_.remove( idx ); }

    void clear() noexcept { arena_.clear(); }

    template <typename Predicate>
    void retain( Predicate && keep )
    {
        if constexpr ( std::is_invocable_r_v<bool, Predicate &, index_type, value_type &> )
            arena_.retain( [ &keep ]( typename untyped_arena::index_type const idx, value_type & value ) { return std::invoke( keep, index_type{ idx }, value ); } );
        else
            arena_.retain( std::forward<Predicate>( keep ) );
    }

    [[ nodiscard, gnu::pure ]] bool               contains( index_type const idx ) const noexcept { return arena_.contains( idx ); }
    [[ nodiscard, gnu::pure ]] value_type       * get     ( index_type const idx )       noexcept { return arena_.get( idx ); }
    [[ nodiscard, gnu::pure ]] value_type const * get     ( index_type const idx ) const noexcept { return arena_.get( idx ); }

    [[ nodiscard ]] value_type       & at( index_type const idx )       { return arena_.at( idx ); }
    [[ nodiscard ]] value_type const & at( index_type const idx ) const { return arena_.at( idx ); }

    [[ nodiscard ]] value_type       & operator[]( index_type const idx )       noexcept { return arena_[ idx ]; }
    [[ nodiscard ]] value_type const & operator[]( index_type const idx ) const noexcept { return arena_[ idx ]; }

    [[ nodiscard ]] result_or_error<std::pair<value_type *, value_type *>> get_pair( index_type const first, index_type const second )
    {
        return arena_.get_pair( first, second );
    }

    [[ nodiscard ]] std::optional<element_reference> get_unknown_gen( size_type const position ) noexcept
    {
        if ( auto const element{ arena_.get_unknown_gen( position ) } )
            return element_reference{ index_type{ element->first }, element->second };
        return std::nullopt;
    }
    [[ nodiscard ]] std::optional<const_element_reference> get_unknown_gen( size_type const position ) const noexcept
    {
        if ( auto const element{ arena_.get_unknown_gen( position ) } )
            return const_element_reference{ index_type{ element->first }, element->second };
        return std::nullopt;
    }

    //! <b>Effects</b>: Same as arena::iter() but yielding typed indices.
    [[ nodiscard ]] auto iter() noexcept
    {
        return arena_.iter() | std::views::transform
        (
            []( typename untyped_arena::element_reference const element ) { return element_reference{ index_type{ element.first }, element.second }; }
        );
    }
    [[ nodiscard ]] auto iter() const noexcept
    {
        return arena_.iter() | std::views::transform
        (
            []( typename untyped_arena::const_element_reference const element ) { return const_element_reference{ index_type{ element.first }, element.second }; }
        );
    }

    ////////////////////////////////////////////////////////////////////////////
    // \class typed_arena::drain_range
    // arena::drain_range yielding typed indices.
    ////////////////////////////////////////////////////////////////////////////
    class drain_range
    {
    public:
        using value_type = std::pair<index_type, T>;

        class iterator
        {
        public:
            using iterator_concept = std::input_iterator_tag;
            using value_type       = typename drain_range::value_type;
            using difference_type  = std::ptrdiff_t;

            iterator() noexcept = default;
            explicit iterator( drain_range & range ) : range_{ &range } { advance(); }

            value_type & operator*() const noexcept { BOOST_ASSERT( current_ ); return *current_; }
            value_type * operator->() const noexcept { return &**this; }

            iterator & operator++() { advance(); return *this; }
            void       operator++( int ) { advance(); }

            friend bool operator==( iterator const & it, std::default_sentinel_t ) noexcept { return !it.current_; }

        private:
            void advance()
            {
                current_.reset();
                if ( auto taken{ range_->next() } )
                    current_.emplace( std::move( *taken ) );
            }

            drain_range *                     range_{};
            mutable std::optional<value_type> current_;
        }; // class iterator

        explicit drain_range( typename untyped_arena::drain_range const untyped ) noexcept : untyped_{ untyped } {}

        std::optional<value_type> next     () { return typed( untyped_.next     () ); }
        std::optional<value_type> next_back() { return typed( untyped_.next_back() ); }

        [[ nodiscard, gnu::pure ]] size_type size () const noexcept { return untyped_.size (); }
        [[ nodiscard, gnu::pure ]] bool      empty() const noexcept { return untyped_.empty(); }

        iterator                begin() { return iterator{ *this }; }
        std::default_sentinel_t end  () const noexcept { return {}; }

    private:
        static std::optional<value_type> typed( std::optional<typename untyped_arena::drain_range::value_type> && element )
        {
            if ( !element )
                return std::nullopt;
            return std::optional<value_type>{ std::in_place, index_type{ element->first }, std::move( element->second ) };
        }

        typename untyped_arena::drain_range untyped_;
    }; // class drain_range

    //! <b>Effects</b>: Same as arena::drain() but yielding typed indices.
    [[ nodiscard ]] drain_range drain() noexcept { return drain_range{ arena_.drain() }; }

    [[ nodiscard ]] untyped_arena       & untyped()       noexcept { return arena_; }
    [[ nodiscard ]] untyped_arena const & untyped() const noexcept { return arena_; }

    friend bool operator==( typed_arena const & left, typed_arena const & right ) { return left.arena_ == right.arena_; }

private:
    static fallible_result<index_type> typed( fallible_result<typename untyped_arena::index_type> && result )
    {
        auto untyped_result{ std::move( result ).as_result_or_error() };
        if ( !untyped_result ) [[ unlikely ]]
            return untyped_result.error();
        return index_type{ *untyped_result };
    }

    untyped_arena arena_;
}; // class typed_arena

//------------------------------------------------------------------------------
} // namespace psi::genarena
//------------------------------------------------------------------------------
