/*
 * File: model.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2025-11-02
 * License: MIT
 */

#pragma once

#include <concepts>
#include <functional>

#include "strata/codec/codec.hpp"
#include "strata/index/page_index.hpp"
#include "strata/page/page.hpp"
#include "strata/page/record.hpp"

namespace strata {

    namespace concepts {

        template <typename M>
        concept StoreModel = requires {
            typename M::key_type;
            typename M::value_type;
            typename M::less_type;
            typename M::key_codec_type;
            typename M::value_codec_type;
        }
            && std::copy_constructible<typename M::key_type>
            && std::copy_constructible<typename M::value_type>
            && std::strict_weak_order<typename M::less_type, typename M::key_type, typename M::key_type>
            && codec::Codec<typename M::key_codec_type, typename M::key_type>
            && codec::Codec<typename M::value_codec_type, typename M::value_type>;
    }

    // Binds a key/value pair to its ordering and codecs. The key codec must
    // agree with less_type: records are validated against that order when
    // they are read back.
    template <typename KeyT, typename ValueT,
        typename LessT = std::less<KeyT>,
        typename KeyCodecT = codec::default_codec<KeyT>,
        typename ValueCodecT = codec::default_codec<ValueT>>
    struct default_model {
        using key_type = KeyT;
        using value_type = ValueT;
        using less_type = LessT;
        using key_codec_type = KeyCodecT;
        using value_codec_type = ValueCodecT;
    };

    template <concepts::StoreModel ModelT>
    struct model_traits {
        using key_type = typename ModelT::key_type;
        using value_type = typename ModelT::value_type;
        using less_type = typename ModelT::less_type;
        using page_type = page::page<key_type, value_type, less_type>;
        using page_codec_type = page::page_codec<page_type,
            typename ModelT::key_codec_type, typename ModelT::value_codec_type>;
        using manifest_type = page::manifest<key_type>;
        using manifest_codec_type = page::manifest_codec<key_type, typename ModelT::key_codec_type>;
        using index_type = index::page_index<key_type, less_type>;
    };
}
