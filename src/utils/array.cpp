// Blackbody multidimensional array

// C++ headers
#include <limits>   // numeric_limits
#include <new>      // bad_alloc
#include <sstream>  // ostringstream

// Blackbody headers
#include "array.hpp"
#include "exceptions.hpp"  // BlackbodyException, BlackbodyResourceException

//--------------------------------------------------------------------------------------------------

// Multidimensional array constructor (empty)
// Inputs: (none)
template<typename type> Array<type>::Array() {}

//--------------------------------------------------------------------------------------------------

// Multidimensional array constructor (1D)
// Inputs:
//   n1_: size of only dimension
template<typename type> Array<type>::Array(int n1_)
{
  Allocate(n1_);
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array constructor (2D)
// Inputs:
//   n2_: size of outermost dimension
//   n1_: size of innermost dimension
template<typename type> Array<type>::Array(int n2_, int n1_)
{
  Allocate(n2_, n1_);
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array constructor (3D)
// Inputs:
//   n3_: size of outermost dimension
//   n2_: size of intermediate dimension
//   n1_: size of innermost dimension
template<typename type> Array<type>::Array(int n3_, int n2_, int n1_)
{
  Allocate(n3_, n2_, n1_);
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array constructor (4D)
// Inputs:
//   n4_: size of outermost dimension
//   n3_, n2_: sizes of intermediate dimensions
//   n1_: size of innermost dimension
template<typename type> Array<type>::Array(int n4_, int n3_, int n2_, int n1_)
{
  Allocate(n4_, n3_, n2_, n1_);
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array constructor (5D)
// Inputs:
//   n5_: size of outermost dimension
//   n4_, n3_, n2_: sizes of intermediate dimensions
//   n1_: size of innermost dimension
template<typename type> Array<type>::Array(int n5_, int n4_, int n3_, int n2_, int n1_)
{
  Allocate(n5_, n4_, n3_, n2_, n1_);
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array copy constructor
// Notes:
//   Result is a shallow alias of the source.
template<typename type> Array<type>::Array(const Array<type> &source)
  : data(source.data),
    n1(source.n1),
    n2(source.n2),
    n3(source.n3),
    n4(source.n4),
    n5(source.n5),
    n_dim(source.n_dim),
    n_tot(source.n_tot),
    allocated(source.allocated),
    is_copy(true) {}

//--------------------------------------------------------------------------------------------------

// Multidimensional array move constructor
// Notes:
//   Takes over the data of the source, which is left unallocated.
template<typename type> Array<type>::Array(Array<type> &&source) noexcept
  : data(source.data),
    n1(source.n1),
    n2(source.n2),
    n3(source.n3),
    n4(source.n4),
    n5(source.n5),
    n_dim(source.n_dim),
    n_tot(source.n_tot),
    allocated(source.allocated),
    is_copy(source.is_copy)
{
  source.data = nullptr;
  source.allocated = false;
  source.is_copy = false;
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array copy assignment operator
// Notes:
//   Releases any data owned by this array before aliasing the source.
//   An owner assigned from one of its own aliases keeps ownership of the data.
template<typename type> Array<type> &Array<type>::operator=(const Array<type> &source)
{
  if (this == &source)
    return *this;
  bool owns_source_data = allocated and not is_copy and data == source.data;
  if (data != source.data)
    Deallocate();
  data = source.data;
  n1 = source.n1;
  n2 = source.n2;
  n3 = source.n3;
  n4 = source.n4;
  n5 = source.n5;
  n_dim = source.n_dim;
  n_tot = source.n_tot;
  allocated = source.allocated;
  is_copy = not owns_source_data;
  return *this;
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array move assignment operator
template<typename type> Array<type> &Array<type>::operator=(Array<type> &&source) noexcept
{
  if (this == &source)
    return *this;
  Deallocate();
  data = source.data;
  n1 = source.n1;
  n2 = source.n2;
  n3 = source.n3;
  n4 = source.n4;
  n5 = source.n5;
  n_dim = source.n_dim;
  n_tot = source.n_tot;
  allocated = source.allocated;
  is_copy = source.is_copy;
  source.data = nullptr;
  source.allocated = false;
  source.is_copy = false;
  return *this;
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array destructor
template<typename type> Array<type>::~Array()
{
  Deallocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (general)
// Inputs: (none)
// Outputs: (none)
// Notes:
//   Assumes n1 through n5 and n_dim have been set.
//   Failure of the system allocator is reported as BlackbodyResourceException.
template<typename type> void Array<type>::Allocate()
{
  if (allocated)
    throw BlackbodyException("Attempting to reallocate array.");
  if (n1 <= 0 or n2 <= 0 or n3 <= 0 or n4 <= 0 or n5 <= 0)
    throw BlackbodyException("Attempting to allocate empty array.");
  n_tot = static_cast<long int>(n1) * static_cast<long int>(n2) * static_cast<long int>(n3)
      * static_cast<long int>(n4) * static_cast<long int>(n5);
  try
  {
    data = new type[n_tot];
  }
  catch (const std::bad_alloc &exception)
  {
    std::ostringstream message;
    message << "Could not allocate array of " << n_tot << " elements ("
        << static_cast<double>(n_tot) * static_cast<double>(sizeof(type)) << " bytes).";
    data = nullptr;
    n_tot = 0;
    throw BlackbodyResourceException(message.str().c_str());
  }
  allocated = true;
  is_copy = false;
  return;
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (0D)
// Inputs: (none)
// Outputs: (none)
// Notes:
//   Allocates a single element that is reported as having no dimensions.
template<typename type> void Array<type>::AllocateScalar()
{
  n1 = 1;
  n2 = 1;
  n3 = 1;
  n4 = 1;
  n5 = 1;
  n_dim = 0;
  Allocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (1D)
// Inputs:
//   n1_: size of only dimension
// Outputs: (none)
template<typename type> void Array<type>::Allocate(int n1_)
{
  n1 = n1_;
  n2 = 1;
  n3 = 1;
  n4 = 1;
  n5 = 1;
  n_dim = 1;
  Allocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (2D)
// Inputs:
//   n2_: size of outermost dimension
//   n1_: size of innermost dimension
// Outputs: (none)
template<typename type> void Array<type>::Allocate(int n2_, int n1_)
{
  n1 = n1_;
  n2 = n2_;
  n3 = 1;
  n4 = 1;
  n5 = 1;
  n_dim = 2;
  Allocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (3D)
// Inputs:
//   n3_: size of outermost dimension
//   n2_: size of intermediate dimension
//   n1_: size of innermost dimension
// Outputs: (none)
template<typename type> void Array<type>::Allocate(int n3_, int n2_, int n1_)
{
  n1 = n1_;
  n2 = n2_;
  n3 = n3_;
  n4 = 1;
  n5 = 1;
  n_dim = 3;
  Allocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (4D)
// Inputs:
//   n4_: size of outermost dimension
//   n3_, n2_: sizes of intermediate dimensions
//   n1_: size of innermost dimension
// Outputs: (none)
template<typename type> void Array<type>::Allocate(int n4_, int n3_, int n2_, int n1_)
{
  n1 = n1_;
  n2 = n2_;
  n3 = n3_;
  n4 = n4_;
  n5 = 1;
  n_dim = 4;
  Allocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (5D)
// Inputs:
//   n5_: size of outermost dimension
//   n4_, n3_, n2_: sizes of intermediate dimensions
//   n1_: size of innermost dimension
// Outputs: (none)
template<typename type> void Array<type>::Allocate(int n5_, int n4_, int n3_, int n2_, int n1_)
{
  n1 = n1_;
  n2 = n2_;
  n3 = n3_;
  n4 = n4_;
  n5 = n5_;
  n_dim = 5;
  Allocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array allocator (arbitrary rank)
// Inputs:
//   n_dim_: number of dimensions, from 0 to max_dims
//   shape: sizes of dimensions, outermost first (ignored if n_dim_ is 0)
// Outputs: (none)
template<typename type> void Array<type>::AllocateShape(int n_dim_, const int *shape)
{
  if (n_dim_ < 0 or n_dim_ > max_dims)
    throw BlackbodyException("Attempting to allocate array with invalid number of dimensions.");
  int *dims[max_dims] = {&n1, &n2, &n3, &n4, &n5};
  for (int d = 0; d < max_dims; d++)
    *dims[d] = d < n_dim_ ? shape[n_dim_-1-d] : 1;
  n_dim = n_dim_;
  Allocate();
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array deallocator
// Inputs: (none)
// Outputs: (none)
template<typename type> void Array<type>::Deallocate()
{
  if (allocated and not is_copy)
    delete[] data;
  data = nullptr;
  allocated = false;
  return;
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array read accessors
// Inputs:
//   i5 through i2: outermost through intermediate indices, as needed
//   i1: innermost index
// Outputs:
//   returned value: element
template<typename type> type Array<type>::operator()(int i1) const
{
  return data[i1];
}
template<typename type> type Array<type>::operator()(int i2, int i1) const
{
  long int index = i1 + static_cast<long int>(n1) * i2;
  return data[index];
}
template<typename type> type Array<type>::operator()(int i3, int i2, int i1) const
{
  long int n1_l = n1;
  long int n2_l = n2;
  long int index = i1 + n1_l * (i2 + n2_l * i3);
  return data[index];
}
template<typename type> type Array<type>::operator()(int i4, int i3, int i2, int i1) const
{
  long int n1_l = n1;
  long int n2_l = n2;
  long int n3_l = n3;
  long int index = i1 + n1_l * (i2 + n2_l * (i3 + n3_l * i4));
  return data[index];
}
template<typename type> type Array<type>::operator()(int i5, int i4, int i3, int i2, int i1) const
{
  long int n1_l = n1;
  long int n2_l = n2;
  long int n3_l = n3;
  long int n4_l = n4;
  long int index = i1 + n1_l * (i2 + n2_l * (i3 + n3_l * (i4 + n4_l * i5)));
  return data[index];
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array read/write accessors
// Inputs:
//   i5 through i2: outermost through intermediate indices, as needed
//   i1: innermost index
// Outputs:
//   returned value: reference to element
template<typename type> type &Array<type>::operator()(int i1)
{
  return data[i1];
}
template<typename type> type &Array<type>::operator()(int i2, int i1)
{
  long int index = i1 + static_cast<long int>(n1) * i2;
  return data[index];
}
template<typename type> type &Array<type>::operator()(int i3, int i2, int i1)
{
  long int n1_l = n1;
  long int n2_l = n2;
  long int index = i1 + n1_l * (i2 + n2_l * i3);
  return data[index];
}
template<typename type> type &Array<type>::operator()(int i4, int i3, int i2, int i1)
{
  long int n1_l = n1;
  long int n2_l = n2;
  long int n3_l = n3;
  long int index = i1 + n1_l * (i2 + n2_l * (i3 + n3_l * i4));
  return data[index];
}
template<typename type> type &Array<type>::operator()(int i5, int i4, int i3, int i2, int i1)
{
  long int n1_l = n1;
  long int n2_l = n2;
  long int n3_l = n3;
  long int n4_l = n4;
  long int index = i1 + n1_l * (i2 + n2_l * (i3 + n3_l * (i4 + n4_l * i5)));
  return data[index];
}

//--------------------------------------------------------------------------------------------------

// Function for checking whether array holds a single dimensionless value
// Inputs: (none)
// Outputs:
//   returned value: true if allocated with no dimensions
template<typename type> bool Array<type>::IsScalar() const
{
  return allocated and n_dim == 0;
}

//--------------------------------------------------------------------------------------------------

// Function for finding size of one dimension
// Inputs:
//   axis: dimension, starting at 0 for outermost dimension
// Outputs:
//   returned value: number of elements along axis
template<typename type> int Array<type>::GetDim(int axis) const
{
  if (axis < 0 or axis >= n_dim)
    throw BlackbodyException("Attempting to access invalid array dimension.");
  const int dims[max_dims] = {n1, n2, n3, n4, n5};
  return dims[n_dim-1-axis];
}

//--------------------------------------------------------------------------------------------------

// Function for extracting shape
// Inputs: (none)
// Outputs:
//   shape: first n_dim values set to sizes of dimensions, outermost first
template<typename type> void Array<type>::GetShape(int *shape) const
{
  for (int axis = 0; axis < n_dim; axis++)
    shape[axis] = GetDim(axis);
  return;
}

//--------------------------------------------------------------------------------------------------

// Function for reinterpreting allocated data with new shape
// Inputs:
//   n_dim_: number of dimensions, from 0 to max_dims
//   shape: sizes of dimensions, outermost first (ignored if n_dim_ is 0)
// Outputs: (none)
// Notes:
//   Total number of elements must be unchanged.
template<typename type> void Array<type>::Reshape(int n_dim_, const int *shape)
{
  if (not allocated)
    throw BlackbodyException("Attempting to reshape unallocated array.");
  if (n_dim_ < 0 or n_dim_ > max_dims)
    throw BlackbodyException("Attempting to reshape array to invalid number of dimensions.");
  long int n_tot_new = 1;
  for (int axis = 0; axis < n_dim_; axis++)
    n_tot_new *= shape[axis];
  if (n_tot_new != n_tot)
  {
    std::ostringstream message;
    message << "Cannot reshape array of " << n_tot << " elements to hold " << n_tot_new << ".";
    throw BlackbodyException(message.str().c_str());
  }
  int *dims[max_dims] = {&n1, &n2, &n3, &n4, &n5};
  for (int d = 0; d < max_dims; d++)
    *dims[d] = d < n_dim_ ? shape[n_dim_-1-d] : 1;
  n_dim = n_dim_;
  return;
}

//--------------------------------------------------------------------------------------------------

// Multidimensional array filling
// Inputs:
//   value: value to assign to every element
// Outputs: (none)
template<typename type> void Array<type>::Fill(type value)
{
  if (allocated)
    for (long int n = 0; n < n_tot; n++)
      data[n] = value;
  return;
}

//--------------------------------------------------------------------------------------------------

// Multidimensional double array NaN-initializing
// Inputs: (none)
// Outputs: (none)
template<> void Array<double>::SetNaN()
{
  Fill(std::numeric_limits<double>::quiet_NaN());
  return;
}

//--------------------------------------------------------------------------------------------------

// Instantiations
template struct Array<bool>;
template struct Array<double>;
