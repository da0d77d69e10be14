#pragma once

#include <cursorctl/schema/history_record.hpp>
#include <scale/scale.hpp>

namespace cursorctl::schema::encoding::scale {

void encode(cursorctl::schema::history_record<1>&& o,
            ::scale::Encoder& encoder);
void decode(cursorctl::schema::history_record<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace cursorctl::schema::encoding::scale
