//
//  PercentEncoding.hpp
//  Apple DOS Shim
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>

namespace Storage::KeyValue {

/*!
	@returns @c source with every byte other than an ASCII letter, digit, '-', '.', '_' or '~'
	replaced by a '%' and two upper-case hex digits.

	The mapping is injective, so distinct names always produce distinct results, and the result is
	safe to use as a single path component on any host.
*/
std::string percent_encode(std::string_view source);

}
