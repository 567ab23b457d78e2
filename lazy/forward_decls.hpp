#pragma once

/*! \brief The namespace for the lazy library.
 *
 * This library holds a result that is either already known or that will be
 * computed by a function when it's asked for. Results can be transformed with
 * map and flat_map without computing anything until get() is finally called.
 */
namespace lazy {

/*! \brief Things in this namespace are implementation details and should not be
 *  used directly.
 */
namespace priv {

template <typename ArgType, typename ResultType, typename FuncT>
class map_call;

template <typename ArgType, typename ResultType, typename FuncT>
class flat_map_call;

} // namespace priv

template <typename ResultType>
class value;

template <typename T>
struct is_value;

} // namespace lazy

// Documentation for some C++11 STL stuff...

/*! \class std::function
 * \brief An STL class that holds any callable object with a given signature.
 *
 * \sa http://en.cppreference.com/w/cpp/utility/functional/function
 */
