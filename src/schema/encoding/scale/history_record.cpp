#include <cursorctl/schema/encoding/scale/action_type.hpp>
#include <cursorctl/schema/encoding/scale/history_record.hpp>

using namespace cursorctl::schema;

namespace cursorctl::schema::encoding::scale {

void encode(history_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.action, encoder);
  encode(o.value, encoder);
  encode(o.recorded_at, encoder);
}

void decode(history_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.action, decoder);
  decode(o.value, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace cursorctl::schema::encoding::scale
