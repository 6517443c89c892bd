//
// Created by LYS on 9/21/2026.
//

#pragma once

#include <stdexcept>
#include <string>

#include <cpptrace/cpptrace.hpp>
#include <spdlog/spdlog.h>

#define LV_TRACE_MESSAGE( MSG ) ( std::string( MSG ) + "\n" + cpptrace::generate_trace().to_string() )

#define LV_THROW_WITH_STACK_AS( EXCEPTION, MSG ) throw EXCEPTION( LV_TRACE_MESSAGE( MSG ) );
#define LV_THROW_WITH_STACK( MSG )               LV_THROW_WITH_STACK_AS( std::runtime_error, MSG )
#define LV_LOG_WITH_STACK( MSG )                 spdlog::error( LV_TRACE_MESSAGE( MSG ) );

#define LV_FILLER                                 static_assert( false )
#define LV_EX_ASSERTIONS( x )                     x
#define LV_MA_ASSERTIONS( _1, _2, _3, NAME, ... ) NAME

#define LV_MAKE_SURE_COND_STR( COND, STR ) \
    if ( !( COND ) ) [[unlikely]]          \
    {                                      \
        LV_THROW_WITH_STACK( STR )         \
    }
#define LV_MAKE_SURE_COND( COND ) LV_MAKE_SURE_COND_STR( COND, #COND )
#define LV_MAKE_SURE( ... )       LV_EX_ASSERTIONS( LV_MA_ASSERTIONS( __VA_ARGS__, LV_FILLER, LV_MAKE_SURE_COND_STR, LV_MAKE_SURE_COND )( __VA_ARGS__ ) )

/// Same as LV_MAKE_SURE but throws a caller chosen exception type (constructible from std::string)
#define LV_MAKE_SURE_AS( COND, EXCEPTION, STR )    \
    if ( !( COND ) ) [[unlikely]]                  \
    {                                              \
        LV_THROW_WITH_STACK_AS( EXCEPTION, STR )   \
    }

#ifdef NDEBUG
#    define LV_CHECK_COND_STR( COND, STR )
#    define LV_CHECK_COND( COND )
#else
#    define LV_CHECK_COND_STR( COND, STR ) \
        if ( !( COND ) ) [[unlikely]]      \
        {                                  \
            LV_THROW_WITH_STACK( STR )     \
        }
#    define LV_CHECK_COND( COND ) LV_CHECK_COND_STR( COND, #COND )
#endif
#define LV_CHECK( ... ) LV_EX_ASSERTIONS( LV_MA_ASSERTIONS( __VA_ARGS__, LV_FILLER, LV_CHECK_COND_STR, LV_CHECK_COND )( __VA_ARGS__ ) )

#define LV_VERIFY_COND_STR_ACTION( COND, STR, ACTION ) \
    if ( !( COND ) ) [[unlikely]]                      \
    {                                                  \
        LV_LOG_WITH_STACK( STR )                       \
        ACTION;                                        \
    }
#define LV_VERIFY_COND_ACTION( COND, ACTION ) LV_VERIFY_COND_STR_ACTION( COND, #COND, ACTION )
#define LV_VERIFY_COND( COND )                LV_VERIFY_COND_STR_ACTION( COND, #COND, ; )
#define LV_VERIFY( ... )                      LV_EX_ASSERTIONS( LV_MA_ASSERTIONS( __VA_ARGS__, LV_VERIFY_COND_STR_ACTION, LV_VERIFY_COND_ACTION, LV_VERIFY_COND )( __VA_ARGS__ ) )
